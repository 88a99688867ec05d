#include "projection.hh"

#include <optional>
#include <string>

struct FullUser {
    std::optional<std::string> id;
    std::optional<std::string> name;

    static constexpr auto graphqlFields() { return gqlc::fields(GQLC_FIELD(FullUser, id), GQLC_FIELD(FullUser, name)); }
};

// `nickname' is not a field of FullUser
struct UserView {
    using FullType = FullUser;

    std::string id;
    std::string nickname;

    static constexpr auto graphqlFields() { return gqlc::fields(GQLC_FIELD(UserView, id), GQLC_FIELD(UserView, nickname)); }
};
GQLC_VERIFY(UserView);

int main() {
    return static_cast<int>(gqlc::selection<UserView>().size());
}
