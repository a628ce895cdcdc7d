#ifndef LIBCIRRUS_UPLOADOPTIONS_H_
#define LIBCIRRUS_UPLOADOPTIONS_H_

#include <cstddef>
#include <cstdint>
#include <string>

namespace Cirrus {
namespace Upload {

/** The access token sent with every upload request */
struct Credential
{
    /** Token type for the Authorization header */
    std::string tokenType { "Bearer" };
    /** Opaque access token */
    std::string accessToken;

    /** Returns the Authorization header value */
    [[nodiscard]] std::string GetHeader() const { return tokenType+" "+accessToken; }
};

/** Upload session config options */
struct UploadOptions
{
    /** The service's hard per-request limit */
    static constexpr uint64_t MAX_CHUNK_CEILING { 150*1024*1024 }; // 150M

    /** Retrieve the standard help text string */
    static std::string HelpText();

    /**
     * Adds the given option/value, returning true iff it was used
     * @throws BaseOptions::BadValueException if invalid arguments
     */
    bool AddOption(const std::string& option, const std::string& value);

    /** Buffer size when relaying from the source stream */
    size_t streamBufferSize { 1048576 }; // 1M
    /** Maximum bytes sent in one request body */
    uint64_t chunkCeiling { 125829120 }; // 120M
};

} // namespace Upload
} // namespace Cirrus

#endif // LIBCIRRUS_UPLOADOPTIONS_H_
