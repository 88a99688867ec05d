#undef NDEBUG

#include "decode.hh"
#include "projection.hh"
#include "query.hh"
#include "timestamp.hh"

#include <nlohmann/json.hpp>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace app {
    enum class Status {
        Unknown,
        Active,
        Archived,
    };
    NLOHMANN_JSON_SERIALIZE_ENUM(Status, {
        { Status::Unknown, nullptr },
        { Status::Active, "ACTIVE" },
        { Status::Archived, "ARCHIVED" },
    })

    struct Label {
        std::string name;
        std::optional<std::string> color;

        static constexpr auto graphqlFields() { return gqlc::fields(GQLC_FIELD(Label, name), GQLC_FIELD(Label, color)); }
    };

    struct Issue {
        std::string id;
        int number = 0;
        double estimate = 0.0;
        bool archived = false;
        Status status = Status::Unknown;
        std::optional<gqlc::Timestamp> created_at;
        std::vector<Label> labels;
        std::optional<gqlc::Box<Issue>> parent;
        nlohmann::json metadata;

        static constexpr auto graphqlFields() {
            return gqlc::fields(
                GQLC_FIELD(Issue, id),
                GQLC_FIELD(Issue, number),
                GQLC_FIELD(Issue, estimate),
                GQLC_FIELD(Issue, archived),
                GQLC_FIELD(Issue, status),
                GQLC_FIELD(Issue, created_at),
                GQLC_NESTED(Issue, labels),
                GQLC_REFERENCE(Issue, parent),
                GQLC_FIELD(Issue, metadata));
        }
    };
}

static void test_timestamps() {
    gqlc::Timestamp ts;
    assert(gqlc::parseTimestamp("1970-01-01T00:00:00Z", ts));
    assert(ts.time_since_epoch().count() == 0);

    assert(gqlc::parseTimestamp("2024-01-31T12:30:00.250Z", ts));
    assert(gqlc::formatTimestamp(ts) == "2024-01-31T12:30:00.250Z");

    gqlc::Timestamp offset;
    assert(gqlc::parseTimestamp("2024-01-31T14:30:00.25+02:00", offset));
    assert(offset == ts);

    assert(gqlc::parseTimestamp("2024-01-31t12:30:00.250123z", offset));
    assert(offset == ts);

    assert(gqlc::parseTimestamp("1969-12-31T23:59:59Z", ts));
    assert(ts.time_since_epoch().count() == -1000);
    assert(gqlc::formatTimestamp(ts) == "1969-12-31T23:59:59.000Z");

    assert(!gqlc::parseTimestamp("", ts));
    assert(!gqlc::parseTimestamp("2024-01-31", ts));
    assert(!gqlc::parseTimestamp("2024-01-31T12:30:00", ts));
    assert(!gqlc::parseTimestamp("2024-13-01T00:00:00Z", ts));
    assert(!gqlc::parseTimestamp("2024-01-31T12:30:00.Z", ts));
    assert(!gqlc::parseTimestamp("2024-01-31T12:30:00Zjunk", ts));

    // days are checked against the month, leap years included
    assert(!gqlc::parseTimestamp("2024-02-31T00:00:00Z", ts));
    assert(!gqlc::parseTimestamp("2023-02-29T00:00:00Z", ts));
    assert(!gqlc::parseTimestamp("2024-04-31T00:00:00Z", ts));
    assert(!gqlc::parseTimestamp("1900-02-29T00:00:00Z", ts));
    assert(gqlc::parseTimestamp("2024-02-29T00:00:00Z", ts));
    assert(gqlc::formatTimestamp(ts) == "2024-02-29T00:00:00.000Z");
    assert(gqlc::parseTimestamp("2000-02-29T00:00:00Z", ts));
    assert(gqlc::parseTimestamp("2024-12-31T23:59:59Z", ts));
}

static void test_decode() {
    auto const doc = nlohmann::json::parse(R"({
        "id": "ISS-1",
        "number": 42,
        "estimate": 3,
        "archived": false,
        "status": "ACTIVE",
        "createdAt": "2024-01-31T12:30:00Z",
        "labels": [ { "name": "bug", "color": null }, { "name": "ui", "color": "#ff0000" } ],
        "parent": { "id": "ISS-0", "status": "SOMETHING_NEW" },
        "metadata": { "any": [1, 2] }
    })");

    app::Issue issue;
    std::string error;
    assert(gqlc::decode(doc, issue, error));
    assert(issue.id == "ISS-1");
    assert(issue.number == 42);
    assert(issue.estimate == 3.0);
    assert(!issue.archived);
    assert(issue.status == app::Status::Active);
    assert(issue.created_at.has_value());
    assert(gqlc::formatTimestamp(*issue.created_at) == "2024-01-31T12:30:00.000Z");
    assert(issue.labels.size() == 2);
    assert(issue.labels[0].name == "bug" && !issue.labels[0].color.has_value());
    assert(issue.labels[1].color == "#ff0000");
    assert(issue.parent.has_value());
    assert((*issue.parent)->id == "ISS-0");
    assert((*issue.parent)->status == app::Status::Unknown);
    assert(issue.metadata["any"].size() == 2);

    // absent and null members keep their value
    app::Issue partial;
    partial.number = 7;
    assert(gqlc::decode(nlohmann::json::parse(R"({"id": "x", "number": null})"), partial, error));
    assert(partial.number == 7);
    assert(partial.id == "x");

    app::Issue bad;
    assert(!gqlc::decode(nlohmann::json::parse(R"({"labels": [ {"name": "ok"}, {"name": 5} ]})"), bad, error));
    assert(error == ".labels[1].name: expected string, got number");

    assert(!gqlc::decode(nlohmann::json::parse(R"({"createdAt": "yesterday"})"), bad, error));
    assert(error == ".createdAt: invalid timestamp `yesterday'");

    assert(!gqlc::decode(nlohmann::json::parse(R"([1, 2])"), bad, error));
    assert(error == ": expected object, got array");
}

static void test_integers() {
    std::string error;

    int value = 5;
    assert(!gqlc::decode(nlohmann::json(4294967297LL), value, error));
    assert(error == ": expected integer in range, got number");
    assert(value == 5);

    assert(!gqlc::decode(nlohmann::json::parse("2147483648"), value, error));
    assert(!gqlc::decode(nlohmann::json(-2147483649LL), value, error));
    assert(gqlc::decode(nlohmann::json::parse("2147483647"), value, error));
    assert(value == 2147483647);
    assert(gqlc::decode(nlohmann::json(-2147483647LL - 1), value, error));
    assert(value == -2147483647 - 1);

    unsigned count = 1;
    assert(!gqlc::decode(nlohmann::json(-1), count, error));
    assert(error == ": expected integer in range, got number");
    assert(gqlc::decode(nlohmann::json(4294967295ULL), count, error));
    assert(count == 4294967295U);

    std::int64_t wide = 0;
    assert(!gqlc::decode(nlohmann::json(18446744073709551615ULL), wide, error));
    assert(gqlc::decode(nlohmann::json(-9007199254740993LL), wide, error));
    assert(wide == -9007199254740993LL);

    // the error carries the member path
    app::Issue issue;
    assert(!gqlc::decode(nlohmann::json::parse(R"({"number": 99999999999})"), issue, error));
    assert(error == ".number: expected integer in range, got number");
}

static void test_extract() {
    std::string error;

    app::Label label;
    assert(gqlc::extractData(nlohmann::json::parse(R"({"data": {"issueLabel": {"name": "bug"}}})"), "issueLabel", label, error));
    assert(label.name == "bug");

    assert(!gqlc::extractData(nlohmann::json::parse(R"({"errors": [{"message": "not authorized"}, {"message": "again"}], "data": null})"), "issueLabel", label, error));
    assert(error == "GraphQL error: not authorized; again");

    assert(!gqlc::extractData(nlohmann::json::parse(R"({"data": {}})"), "issueLabel", label, error));
    assert(error == "no `issueLabel' in response data");

    assert(!gqlc::extractData(nlohmann::json::parse(R"({})"), "issueLabel", label, error));
    assert(error == "no data in response");

    assert(!gqlc::extractData(nlohmann::json::parse(R"({"data": {"issueLabel": {"name": 1}}})"), "issueLabel", label, error));
    assert(error == "failed to decode `issueLabel': issueLabel.name: expected string, got number");

    gqlc::Connection<app::Label> page;
    assert(gqlc::extractData(nlohmann::json::parse(R"({"data": {"issueLabels": {
        "nodes": [ {"name": "a"}, {"name": "b"} ],
        "pageInfo": {"hasNextPage": true, "endCursor": "c2"}
    }}})"), "issueLabels", page, error));
    assert(page.nodes.size() == 2);
    assert(page.nodes[1].name == "b");
    assert(page.pageInfo.hasNextPage);
    assert(page.pageInfo.endCursor == "c2");
}

int main() {
    test_timestamps();
    test_decode();
    test_integers();
    test_extract();
}
