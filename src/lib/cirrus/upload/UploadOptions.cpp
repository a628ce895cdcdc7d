
#include <sstream>
#include <stdexcept>

#include "UploadOptions.hpp"
#include "cirrus/BaseOptions.hpp"
#include "cirrus/StringUtil.hpp"

namespace Cirrus {
namespace Upload {

namespace {

/** Parses a byte count (e.g. 8M) between 1 and MAX_CHUNK_CEILING for the given option */
uint64_t ParseSize(const std::string& option, const std::string& value)
{
    uint64_t bytes { 0 };
    try { bytes = StringUtil::stringToBytes(value, UploadOptions::MAX_CHUNK_CEILING); }
    catch (const std::logic_error& e) {
        throw BaseOptions::BadValueException(option); }

    if (!bytes) throw BaseOptions::BadValueException(option);
    return bytes;
}

} // namespace

/*****************************************************/
std::string UploadOptions::HelpText()
{
    std::ostringstream output;
    const UploadOptions optDefault;

    output << "Upload Advanced: [--chunk-size bytes(" << StringUtil::bytesToString(optDefault.chunkCeiling) << ", max " << StringUtil::bytesToString(MAX_CHUNK_CEILING) << ")] "
           << "[--stream-buffer-size bytes(" << StringUtil::bytesToString(optDefault.streamBufferSize) << ", max " << StringUtil::bytesToString(MAX_CHUNK_CEILING) << ")]";

    return output.str();
}

/*****************************************************/
bool UploadOptions::AddOption(const std::string& option, const std::string& value)
{
    if (option == "chunk-size")
        chunkCeiling = ParseSize(option, value);
    else if (option == "stream-buffer-size")
        streamBufferSize = static_cast<size_t>(ParseSize(option, value));
    else return false; // not used

    return true;
}

} // namespace Upload
} // namespace Cirrus
