#include "RouteClassifier.hpp"
#include <algorithm>
#include <utility>

RouteClassifier::RouteClassifier(std::vector<std::string> pub, std::vector<std::string> priv)
    : public_prefixes(std::move(pub)),
    private_prefixes(std::move(priv))
{
}

bool RouteClassifier::matchesAny(const std::vector<std::string>& prefixes, const std::string& path) {
    return std::any_of(prefixes.begin(), prefixes.end(),
        [&path](const std::string& route) {
            return path == route || path.compare(0, route.size(), route) == 0;
        });
}

RouteClass RouteClassifier::classify(const std::string& path) const {
    std::string bare = path.substr(0, path.find_first_of("?#"));

    RouteClass rc;
    rc.is_public = matchesAny(public_prefixes, bare);
    rc.is_private = matchesAny(private_prefixes, bare);
    return rc;
}
