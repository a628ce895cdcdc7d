#include "catch2/catch_test_macros.hpp"

#include "cirrus/upload/UploadArgs.hpp"

namespace Cirrus {
namespace Upload {

/*****************************************************/
TEST_CASE("CursorHeader", "[UploadArgs]")
{
    const SessionCursor cursor { "AAAAAAAAAAnY", 125829120 };
    REQUIRE(ToArgHeader(cursor) == R"({"offset":125829120,"session_id":"AAAAAAAAAAnY"})");
}

/*****************************************************/
TEST_CASE("FinishHeader", "[UploadArgs]")
{
    UploadSessionFinish finish { SessionCursor{"sid", 25}, CommitInfo{"/docs/a.txt", true, false} };
    REQUIRE(ToArgHeader(finish) == R"({"commit":{"autorename":true,"mode":"add","mute":false,"path":"/docs/a.txt"},"cursor":{"offset":25,"session_id":"sid"}})");

    finish.commit.path = "/caf\xC3\xA9 \"x\".txt"; // UTF-8 e-acute
    REQUIRE(ToArgHeader(finish) == R"({"commit":{"autorename":true,"mode":"add","mute":false,"path":"/caf\u00e9 \"x\".txt"},"cursor":{"offset":25,"session_id":"sid"}})");

    finish.commit.path = "/bad\xFF";
    REQUIRE_THROWS_AS(static_cast<void>(ToArgHeader(finish)), WireFormatException);
}

/*****************************************************/
TEST_CASE("ParseSessionID", "[UploadArgs]")
{
    REQUIRE(ParseSessionID(R"({"session_id":"AAAAAAAAAAnY"})") == "AAAAAAAAAAnY");
    REQUIRE(ParseSessionID(R"({"other":1,"session_id":"x"})") == "x");

    REQUIRE_THROWS_AS(static_cast<void>(ParseSessionID("")), WireFormatException);
    REQUIRE_THROWS_AS(static_cast<void>(ParseSessionID("<html>")), WireFormatException);
    REQUIRE_THROWS_AS(static_cast<void>(ParseSessionID("[]")), WireFormatException);
    REQUIRE_THROWS_AS(static_cast<void>(ParseSessionID("{}")), WireFormatException);
    REQUIRE_THROWS_AS(static_cast<void>(ParseSessionID(R"({"session_id":5})")), WireFormatException);
    REQUIRE_THROWS_AS(static_cast<void>(ParseSessionID(R"({"session_id":""})")), WireFormatException);
}

/*****************************************************/
TEST_CASE("FileMetadata", "[UploadArgs]")
{
    const FileMetadata meta { FileMetadata::FromJSON(R"({
        "name": "a.txt", "id": "id:a4ayc_80_OEAAAAAAAAAXw",
        "path_lower": "/docs/a.txt", "path_display": "/Docs/a.txt",
        "rev": "a1c10ce0dd78", "size": 7212,
        "content_hash": "e3b0c44298fc1c149afbf4c8996fb924",
        "client_modified": "2015-05-12T15:50:38Z",
        "server_modified": "2015-05-12T15:50:38Z",
        "is_downloadable": true })") };

    REQUIRE(meta.name == "a.txt");
    REQUIRE(meta.id == "id:a4ayc_80_OEAAAAAAAAAXw");
    REQUIRE(meta.pathLower == "/docs/a.txt");
    REQUIRE(meta.pathDisplay == "/Docs/a.txt");
    REQUIRE(meta.rev == "a1c10ce0dd78");
    REQUIRE(meta.size == 7212);
    REQUIRE(meta.contentHash == "e3b0c44298fc1c149afbf4c8996fb924");
    REQUIRE(meta.clientModified == "2015-05-12T15:50:38Z");

    const FileMetadata minimal { FileMetadata::FromJSON(R"({"name":"b","id":"id:b"})") };
    REQUIRE(minimal.name == "b");
    REQUIRE(minimal.size == 0);
    REQUIRE(minimal.rev.empty());

    REQUIRE_THROWS_AS(static_cast<void>(FileMetadata::FromJSON("{}")), WireFormatException);
    REQUIRE_THROWS_AS(static_cast<void>(FileMetadata::FromJSON(R"({"name":1,"id":"x"})")), WireFormatException);
    REQUIRE_THROWS_AS(static_cast<void>(FileMetadata::FromJSON("nope")), WireFormatException);
}

} // namespace Upload
} // namespace Cirrus
