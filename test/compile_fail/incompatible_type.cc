#include "projection.hh"

#include <optional>
#include <string>

struct FullIssue {
    std::optional<std::string> id;
    std::optional<double> priority;

    static constexpr auto graphqlFields() { return gqlc::fields(GQLC_FIELD(FullIssue, id), GQLC_FIELD(FullIssue, priority)); }
};

// priority is a Float on the full type
struct IssueView {
    using FullType = FullIssue;

    std::string id;
    std::string priority;

    static constexpr auto graphqlFields() { return gqlc::fields(GQLC_FIELD(IssueView, id), GQLC_FIELD(IssueView, priority)); }
};
GQLC_VERIFY(IssueView);

int main() {
    return static_cast<int>(gqlc::selection<IssueView>().size());
}
