#include "projection.hh"
#include "query.hh"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

struct FullTeam {
    std::optional<std::string> id;
    std::optional<std::string> key;

    static constexpr auto graphqlFields() { return gqlc::fields(GQLC_FIELD(FullTeam, id), GQLC_FIELD(FullTeam, key)); }
};

// `slug' is not a field of FullTeam, and the view is only ever decoded
struct TeamView {
    using FullType = FullTeam;

    std::string id;
    std::string slug;

    static constexpr auto graphqlFields() { return gqlc::fields(GQLC_FIELD(TeamView, id), GQLC_FIELD(TeamView, slug)); }
};

int main() {
    TeamView team;
    std::string error;
    auto const response = nlohmann::json::parse(R"({ "data": { "team": { "id": "t1", "slug": "eng" } } })");
    return gqlc::extractData(response, "team", team, error) ? 0 : 1;
}
