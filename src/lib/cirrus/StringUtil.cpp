
#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

#include "StringUtil.hpp"

namespace Cirrus {

namespace {

/** Size units in increasing order, each 1024x the one before */
constexpr std::array<char,6> sizeUnits { '\0', 'K', 'M', 'G', 'T', 'P' };
constexpr uint64_t unitFactor { 1024 };

bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

} // namespace

/*****************************************************/
StringUtil::StringList StringUtil::splitList(const std::string& str, char delim)
{
    StringList retval;

    size_t start { 0 }; while (start <= str.size())
    {
        size_t end { str.find(delim, start) };
        if (end == std::string::npos) end = str.size();

        std::string item { trim(str.substr(start, end-start)) };
        if (!item.empty()) retval.push_back(std::move(item));

        start = end + 1;
    }

    return retval;
}

/*****************************************************/
StringUtil::StringPair StringUtil::split(const std::string& str, const std::string& delim, bool last)
{
    const size_t pos { last ? str.rfind(delim) : str.find(delim) };

    if (delim.empty() || pos == std::string::npos)
        return last ? StringPair{"", str} : StringPair{str, ""};

    return { str.substr(0, pos), str.substr(pos + delim.size()) };
}

/*****************************************************/
bool StringUtil::startsWith(const std::string& str, const std::string& start)
{
    return str.size() >= start.size() && str.compare(0, start.size(), start) == 0;
}

/*****************************************************/
bool StringUtil::endsWith(const std::string& str, const std::string& end)
{
    return str.size() >= end.size() &&
        str.compare(str.size()-end.size(), end.size(), end) == 0;
}

/*****************************************************/
void StringUtil::trim_void(std::string& str)
{
    const std::string::iterator last { std::find_if_not(str.rbegin(), str.rend(), isSpace).base() };
    str.erase(last, str.end());

    const std::string::iterator first { std::find_if_not(str.begin(), str.end(), isSpace) };
    str.erase(str.begin(), first);
}

/*****************************************************/
std::string StringUtil::trim(const std::string& str)
{
    std::string retval { str }; // copy
    trim_void(retval); return retval;
}

/*****************************************************/
uint64_t StringUtil::stringToUnsigned(const std::string& str, uint64_t max)
{
    const std::string digits { trim(str) };

    // stoull would accept a sign, leading space or trailing junk
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), isDigit))
        throw std::invalid_argument("not a number: "+str);

    const uint64_t retval { std::stoull(digits) }; // throws std::out_of_range
    if (retval > max) throw std::out_of_range("larger than "+std::to_string(max));
    return retval;
}

/*****************************************************/
uint64_t StringUtil::stringToBytes(const std::string& str, uint64_t max)
{
    std::string number { trim(str) };

    uint64_t factor { 1 };
    if (!number.empty() && !isDigit(number.back()))
    {
        const char unit { static_cast<char>(std::toupper(static_cast<unsigned char>(number.back()))) };
        const decltype(sizeUnits)::const_iterator it { std::find(sizeUnits.cbegin()+1, sizeUnits.cend(), unit) };
        if (it == sizeUnits.cend())
            throw std::invalid_argument("unknown size unit: "+str);

        for (decltype(sizeUnits)::const_iterator it2 { sizeUnits.cbegin() }; it2 != it; ++it2)
            factor *= unitFactor;
        number.pop_back();
    }

    return stringToUnsigned(number, max / factor) * factor;
}

/*****************************************************/
std::string StringUtil::bytesToString(uint64_t bytes)
{
    size_t unit { 0 };
    while (bytes != 0 && bytes % unitFactor == 0 && unit+1 < sizeUnits.size())
    {
        bytes /= unitFactor; ++unit;
    }

    std::string retval { std::to_string(bytes) };
    if (unit != 0) retval += sizeUnits[unit];
    return retval;
}

} // namespace Cirrus
