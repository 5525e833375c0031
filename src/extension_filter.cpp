#include "extension_filter.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

FilterPolicy FilterPolicy::unrestricted() {
    return FilterPolicy{};
}

FilterPolicy FilterPolicy::include(std::set<std::string> extensions) {
    return FilterPolicy{Mode::Include, std::move(extensions)};
}

FilterPolicy FilterPolicy::exclude(std::set<std::string> extensions) {
    return FilterPolicy{Mode::Exclude, std::move(extensions)};
}

FilterPolicy FilterPolicy::fromLists(const std::string& includeList, const std::string& excludeList) {
    auto included = parseExtensionList(includeList);
    if (!included.empty()) {
        return include(std::move(included));
    }
    auto excluded = parseExtensionList(excludeList);
    if (!excluded.empty()) {
        return exclude(std::move(excluded));
    }
    return unrestricted();
}

std::string normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    if (extension.empty()) {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}

std::set<std::string> parseExtensionList(const std::string& pipeDelimited) {
    std::set<std::string> extensions;
    std::istringstream stream(pipeDelimited);
    std::string token;
    while (std::getline(stream, token, '|')) {
        auto normalized = normalizeExtension(token);
        // a lone "." is not an extension
        if (normalized.size() > 1) {
            extensions.insert(std::move(normalized));
        }
    }
    return extensions;
}

bool shouldProcess(const std::string& extension, const FilterPolicy& policy) {
    auto normalized = normalizeExtension(extension);
    if (normalized.size() <= 1) {
        return false;
    }

    switch (policy.mode) {
    case FilterPolicy::Mode::Include:
        return policy.extensions.contains(normalized);
    case FilterPolicy::Mode::Exclude:
        return !policy.extensions.contains(normalized);
    case FilterPolicy::Mode::Unrestricted:
        break;
    }
    return true;
}
