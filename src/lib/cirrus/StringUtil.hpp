#ifndef LIBCIRRUS_STRINGUTIL_H_
#define LIBCIRRUS_STRINGUTIL_H_

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#define BOOLSTR(x) ((x) ? "true" : "false")

namespace Cirrus {

/** String parsing for options, config files and URLs */
class StringUtil
{
public:

    StringUtil() = delete; // static only

    using StringList = std::vector<std::string>;

    /**
     * Splits a delimited list like "a, b,,c" into trimmed items
     * Empty items are dropped
     */
    [[nodiscard]] static StringList splitList(const std::string& str, char delim);

    using StringPair = std::pair<std::string, std::string>;

    /**
     * Splits a string in two at a delimiter
     * @param last if true, split at the last delim rather than the first
     * @return the part without delim is empty if delim is not found
     *   (second if splitting at the first, else first)
     */
    [[nodiscard]] static StringPair split(
        const std::string& str, const std::string& delim, bool last = false);

    /** Returns true iff str starts with start */
    [[nodiscard]] static bool startsWith(const std::string& str, const std::string& start);

    /** Returns true iff str ends with end */
    [[nodiscard]] static bool endsWith(const std::string& str, const std::string& end);

    /** Removes leading/trailing whitespace from the string (in place) */
    static void trim_void(std::string& str);

    /** Returns the string with leading/trailing whitespace stripped */
    [[nodiscard]] static std::string trim(const std::string& str);

    /**
     * Parses a whole string (surrounding whitespace allowed) as a decimal number
     * @param max the largest value accepted
     * @throws std::invalid_argument if not only digits
     * @throws std::out_of_range if larger than max
     */
    [[nodiscard]] static uint64_t stringToUnsigned(const std::string& str,
        uint64_t max = std::numeric_limits<uint64_t>::max());

    /**
     * Converts a size like "4096", "8K" or "120 M" to # of bytes
     * The only units are K, M, G, T and P (powers of 1024)
     * @param max the largest # of bytes accepted
     * @throws std::invalid_argument if not a number with an optional unit
     * @throws std::out_of_range if larger than max
     */
    [[nodiscard]] static uint64_t stringToBytes(const std::string& str,
        uint64_t max = std::numeric_limits<uint64_t>::max());

    /**
     * Converts # of bytes to a string like "256K" or "120M"
     * using the biggest unit that divides it exactly
     */
    [[nodiscard]] static std::string bytesToString(uint64_t bytes);
};

} // namespace Cirrus

#endif // LIBCIRRUS_STRINGUTIL_H_
