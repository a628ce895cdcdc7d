#ifndef LIBCIRRUS_TEMPPATH_H_
#define LIBCIRRUS_TEMPPATH_H_

#include <filesystem>
#include <random>
#include <string>

#include "cirrus/common.hpp"

namespace Cirrus {

/** Auto-deleting temporary file path */
class TempPath
{
public:

    /** Create a temp path with the given suffix - does NOT create the file! */
    explicit TempPath(const std::string& suffix) :
        mPath(std::filesystem::temp_directory_path().string()+"/cirrus_"
            +RandomName()+"_"+suffix) { }

    virtual ~TempPath()
    {
        std::error_code error; // never throw from here
        std::filesystem::remove(mPath, error);
    }
    DELETE_COPY(TempPath)
    DELETE_MOVE(TempPath)

    /** returns the temporary path generated */
    [[nodiscard]] const std::string& Get() const { return mPath; }

private:

    /** Returns 16 random lowercase letters */
    static std::string RandomName()
    {
        std::random_device rd;
        std::uniform_int_distribution<int> dist('a', 'z');
        std::string retval(16, 'a');
        for (char& c : retval) c = static_cast<char>(dist(rd));
        return retval;
    }

    // path to the created file
    const std::string mPath;
};

} // namespace Cirrus

#endif // LIBCIRRUS_TEMPPATH_H_
