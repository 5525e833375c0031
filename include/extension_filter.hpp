/**
 * @file extension_filter.hpp
 * @brief Extension based include/exclude policy for SftpTransfer.
 *
 * Decides whether a discovered file is eligible for upload. Extensions are compared
 * lower-cased and with their leading dot (".csv").
 */

#ifndef EXTENSION_FILTER_HPP
#define EXTENSION_FILTER_HPP

#include <set>
#include <string>

/**
 * @brief Which files a run processes, selected by file extension.
 *
 * Exactly one mode is active. When both an include and an exclude list are configured the
 * include list wins and the exclude list is ignored.
 */
struct FilterPolicy {
    enum class Mode {
        Unrestricted, ///< Every file with an extension is processed.
        Include,      ///< Only extensions in the set are processed.
        Exclude       ///< Every extension except those in the set is processed.
    };

    Mode mode = Mode::Unrestricted;  ///< Active policy variant.
    std::set<std::string> extensions; ///< Normalized extensions for Include/Exclude.

    static FilterPolicy unrestricted();
    static FilterPolicy include(std::set<std::string> extensions);
    static FilterPolicy exclude(std::set<std::string> extensions);

    /**
     * @brief Builds a policy from the pipe-delimited configuration strings.
     *
     * @param includeList e.g. ".csv|.txt"; takes precedence when it yields any extension.
     * @param excludeList e.g. ".tmp|.part"; used only when the include list is empty.
     * @return FilterPolicy Include, Exclude or Unrestricted policy.
     */
    static FilterPolicy fromLists(const std::string& includeList, const std::string& excludeList);
};

/**
 * @brief Normalizes an extension: strips whitespace, enforces the dot prefix, lower-cases.
 *
 * @return std::string Normalized extension, or an empty string for an empty input.
 */
std::string normalizeExtension(std::string extension);

/**
 * @brief Splits a pipe-delimited extension list into a set of normalized extensions.
 *
 * Empty tokens are dropped, so "" and "|" both yield an empty set.
 */
std::set<std::string> parseExtensionList(const std::string& pipeDelimited);

/**
 * @brief Decides whether a file with the given extension should be processed.
 *
 * A file without an extension is never processed, whatever the policy.
 *
 * @param extension File extension including the dot, as produced by discovery.
 * @param policy Active filter policy.
 * @return bool True if the file is eligible for upload.
 */
bool shouldProcess(const std::string& extension, const FilterPolicy& policy);

#endif // EXTENSION_FILTER_HPP
