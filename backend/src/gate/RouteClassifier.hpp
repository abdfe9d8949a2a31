#pragma once
#include <string>
#include <vector>

struct RouteClass {
    bool is_public = false;
    bool is_private = false;

    // Private wins whenever both lists match.
    bool requiresAuth() const { return is_private; }
};

// Pure prefix classifier: a path matches an entry when it equals it or starts
// with it. Holds nothing but the two configured lists.
class RouteClassifier {
public:
    RouteClassifier(std::vector<std::string> public_prefixes,
        std::vector<std::string> private_prefixes);

    // Anything from the first '?' or '#' on is ignored.
    RouteClass classify(const std::string& path) const;

    static bool matchesAny(const std::vector<std::string>& prefixes, const std::string& path);

    const std::vector<std::string>& publicPrefixes() const { return public_prefixes; }
    const std::vector<std::string>& privatePrefixes() const { return private_prefixes; }

private:
    std::vector<std::string> public_prefixes;
    std::vector<std::string> private_prefixes;
};
