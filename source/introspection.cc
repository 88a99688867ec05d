// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "introspection.hh"
#include "schema.hh"
#include "transport.hh"

#include <algorithm>
#include <exception>
#include <ostream>
#include <sstream>

namespace gqlc {
    using namespace std::literals;

    std::string_view const introspectionQuery = R"(query IntrospectionQuery {
  __schema {
    types {
      kind
      name
      description
      fields(includeDeprecated: true) {
        name
        description
        args {
          name
          description
          type { ...TypeRef }
          defaultValue
        }
        type { ...TypeRef }
        isDeprecated
        deprecationReason
      }
      inputFields {
        name
        description
        type { ...TypeRef }
        defaultValue
      }
      interfaces { ...TypeRef }
      enumValues(includeDeprecated: true) {
        name
        description
        isDeprecated
        deprecationReason
      }
      possibleTypes { ...TypeRef }
    }
    directives {
      name
      description
      locations
      args {
        name
        description
        type { ...TypeRef }
        defaultValue
      }
    }
  }
}

fragment TypeRef on __Type {
  kind
  name
  ofType {
    kind
    name
    ofType {
      kind
      name
      ofType {
        kind
        name
        ofType {
          kind
          name
          ofType {
            kind
            name
            ofType {
              kind
              name
              ofType {
                kind
                name
              }
            }
          }
        }
      }
    }
  }
}
)"sv;

    std::ostream& operator<<(std::ostream& os, SchemaFetchError const& error) {
        switch (error.kind) {
        case SchemaFetchError::Kind::HttpStatus:
            os << "HTTP " << error.status;
            if (!error.message.empty())
                os << ": " << error.message;
            return os;
        case SchemaFetchError::Kind::Transport:
            return os << "HTTP request failed: " << error.message;
        case SchemaFetchError::Kind::Json:
            return os << "failed to parse JSON: " << error.message;
        case SchemaFetchError::Kind::MissingSchema:
        default:
            return os << error.message;
        }
    }

    namespace {
        using json = nlohmann::json;

        json const nullJson;

        json const& member(json const& j, char const* key) {
            if (!j.is_object())
                return nullJson;
            auto const it = j.find(key);
            return it != j.end() ? *it : nullJson;
        }

        std::string_view stringMember(json const& j, char const* key) {
            auto const& value = member(j, key);
            if (!value.is_string())
                return {};
            return value.get_ref<std::string const&>();
        }

        int kindRank(std::string_view kind) {
            if (kind == "SCALAR"sv) return 0;
            if (kind == "ENUM"sv) return 1;
            if (kind == "INPUT_OBJECT"sv) return 2;
            if (kind == "INTERFACE"sv) return 3;
            if (kind == "OBJECT"sv) return 4;
            if (kind == "UNION"sv) return 5;
            return 6;
        }

        std::string quoted(std::string_view text) {
            std::string result = "\"";
            for (char const ch : text) {
                if (ch == '"' || ch == '\\')
                    result.push_back('\\');
                result.push_back(ch);
            }
            result.push_back('"');
            return result;
        }

        struct SdlWriter {
            std::ostringstream out;

            // Writes the element's description. Single-line descriptions stay
            // on the element's line; returns true if the element must not be
            // indented again.
            bool description(json const& element, std::string_view indent) {
                auto const text = stringMember(element, "description");
                if (text.empty())
                    return false;

                out << indent;
                if (text.find('\n') != std::string_view::npos) {
                    std::string block(text);
                    for (size_t pos = block.find(R"(""")"); pos != std::string::npos; pos = block.find(R"(""")", pos + 4))
                        block.insert(pos, 1, '\\');
                    out << R"(""")" << block << R"(""")" << '\n';
                    return false;
                }

                out << quoted(text) << ' ';
                return true;
            }

            void deprecation(json const& element) {
                auto const& deprecated = member(element, "isDeprecated");
                if (!deprecated.is_boolean() || !deprecated.get<bool>())
                    return;

                auto const& reason = member(element, "deprecationReason");
                if (reason.is_string())
                    out << " @deprecated(reason: " << quoted(reason.get_ref<std::string const&>()) << ')';
                else
                    out << " @deprecated";
            }

            void defaultValue(json const& element) {
                auto const value = stringMember(element, "defaultValue");
                if (!value.empty())
                    out << " = " << value;
            }

            void typeRef(json const& ref) {
                auto const kind = stringMember(ref, "kind");
                if (kind == "NON_NULL"sv) {
                    typeRef(member(ref, "ofType"));
                    out << '!';
                }
                else if (kind == "LIST"sv) {
                    out << '[';
                    typeRef(member(ref, "ofType"));
                    out << ']';
                }
                else {
                    auto const name = stringMember(ref, "name");
                    out << (name.empty() ? "Unknown"sv : name);
                }
            }

            void interfaces(json const& type) {
                auto const& list = member(type, "interfaces");
                if (!list.is_array())
                    return;

                bool first = true;
                for (auto const& iface : list) {
                    auto const name = stringMember(iface, "name");
                    if (name.empty())
                        continue;
                    out << (first ? " implements "sv : " & "sv) << name;
                    first = false;
                }
            }

            void fields(json const& type) {
                auto const& list = member(type, "fields");
                if (!list.is_array())
                    return;

                for (auto const& field : list) {
                    if (!description(field, "  "))
                        out << "  ";
                    out << stringMember(field, "name");

                    auto const& args = member(field, "args");
                    if (args.is_array() && !args.empty()) {
                        out << '(';
                        bool first = true;
                        for (auto const& arg : args) {
                            if (!first)
                                out << ", ";
                            first = false;
                            out << stringMember(arg, "name") << ": ";
                            typeRef(member(arg, "type"));
                            defaultValue(arg);
                        }
                        out << ')';
                    }

                    out << ": ";
                    typeRef(member(field, "type"));
                    deprecation(field);
                    out << '\n';
                }
            }

            void enumValues(json const& type) {
                auto const& list = member(type, "enumValues");
                if (!list.is_array())
                    return;

                for (auto const& value : list) {
                    if (!description(value, "  "))
                        out << "  ";
                    out << stringMember(value, "name");
                    deprecation(value);
                    out << '\n';
                }
            }

            void inputFields(json const& type) {
                auto const& list = member(type, "inputFields");
                if (!list.is_array())
                    return;

                for (auto const& field : list) {
                    if (!description(field, "  "))
                        out << "  ";
                    out << stringMember(field, "name") << ": ";
                    typeRef(member(field, "type"));
                    defaultValue(field);
                    out << '\n';
                }
            }

            void unionMembers(json const& type) {
                auto const& list = member(type, "possibleTypes");
                if (!list.is_array())
                    return;

                bool first = true;
                for (auto const& possible : list) {
                    auto const name = stringMember(possible, "name");
                    if (name.empty())
                        continue;
                    if (!first)
                        out << " | ";
                    out << name;
                    first = false;
                }
            }

            void type(json const& type) {
                auto const kind = stringMember(type, "kind");
                auto const name = stringMember(type, "name");

                if (kind == "SCALAR"sv) {
                    description(type, "");
                    out << "scalar " << name << "\n\n";
                }
                else if (kind == "ENUM"sv) {
                    description(type, "");
                    out << "enum " << name << " {\n";
                    enumValues(type);
                    out << "}\n\n";
                }
                else if (kind == "INPUT_OBJECT"sv) {
                    description(type, "");
                    out << "input " << name << " {\n";
                    inputFields(type);
                    out << "}\n\n";
                }
                else if (kind == "OBJECT"sv || kind == "INTERFACE"sv) {
                    description(type, "");
                    out << (kind == "OBJECT"sv ? "type "sv : "interface "sv) << name;
                    interfaces(type);
                    out << " {\n";
                    fields(type);
                    out << "}\n\n";
                }
                else if (kind == "UNION"sv) {
                    description(type, "");
                    out << "union " << name << " = ";
                    unionMembers(type);
                    out << "\n\n";
                }
            }
        };
    }

    std::string introspectionToSdl(nlohmann::json const& schema) {
        std::vector<json const*> types;

        auto const& list = member(schema, "types");
        if (list.is_array()) {
            for (auto const& type : list) {
                auto const name = stringMember(type, "name");
                if (name.substr(0, 2) == "__"sv)
                    continue;
                if (stringMember(type, "kind") == "SCALAR"sv && schema::isBuiltinScalar(std::string(name)))
                    continue;
                types.push_back(&type);
            }
        }

        std::stable_sort(types.begin(), types.end(), [](json const* lhs, json const* rhs) {
            auto const lhsRank = kindRank(stringMember(*lhs, "kind"));
            auto const rhsRank = kindRank(stringMember(*rhs, "kind"));
            if (lhsRank != rhsRank)
                return lhsRank < rhsRank;
            return stringMember(*lhs, "name") < stringMember(*rhs, "name");
        });

        SdlWriter writer;
        for (auto const* type : types)
            writer.type(*type);
        return writer.out.str();
    }

    bool renderSchema(nlohmann::json const& response, std::string& out_sdl, SchemaFetchError& out_error) {
        auto const& schema = member(member(response, "data"), "__schema");
        if (!schema.is_object()) {
            out_error = SchemaFetchError{ SchemaFetchError::Kind::MissingSchema, 0, "no __schema in response" };
            return false;
        }

        out_sdl = introspectionToSdl(schema);
        return true;
    }

    bool handleResponse(HttpResponse const& response, std::string& out_sdl, SchemaFetchError& out_error) {
        if (!response.ok()) {
            out_error = SchemaFetchError{ SchemaFetchError::Kind::HttpStatus, response.status, {} };
            return false;
        }

        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(response.body);
        }
        catch (nlohmann::json::parse_error const& ex) {
            out_error = SchemaFetchError{ SchemaFetchError::Kind::Json, 0, ex.what() };
            return false;
        }

        return renderSchema(doc, out_sdl, out_error);
    }

    bool fetchSchema(FetchOptions const& options, std::string& out_sdl, SchemaFetchError& out_error) {
        HttpRequest request;
        request.url = options.url;
        request.headers = options.headers;
        request.body = nlohmann::json{ { "query", std::string(introspectionQuery) } }.dump();

        HttpResponse response;
        try {
            response = httpPost(request);
        }
        catch (std::exception const& ex) {
            out_error = SchemaFetchError{ SchemaFetchError::Kind::Transport, 0, ex.what() };
            return false;
        }

        return handleResponse(response, out_sdl, out_error);
    }
}
