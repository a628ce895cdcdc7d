#include "catch2/catch_test_macros.hpp"

#include "cirrus/BaseOptions.hpp"
#include "cirrus/backend/HTTPOptions.hpp"
#include "cirrus/backend/RunnerOptions.hpp"

namespace Cirrus {
namespace Backend {

/*****************************************************/
TEST_CASE("HTTPOptions", "[Options]")
{
    HTTPOptions options;
    REQUIRE(options.tlsCertVerify);
    REQUIRE(options.proxyHost.empty());

    REQUIRE(options.AddFlag("no-tls-verify"));
    REQUIRE(!options.tlsCertVerify);
    REQUIRE(!options.AddFlag("mute"));

    REQUIRE(options.AddOption("hproxy-host", "proxy.local"));
    REQUIRE(options.AddOption("hproxy-port", "3128"));
    REQUIRE(options.AddOption("hproxy-user", "user1"));
    REQUIRE(options.AddOption("hproxy-pass", "pass1"));
    REQUIRE(options.proxyHost == "proxy.local");
    REQUIRE(options.proxyPort == 3128);
    REQUIRE(options.proxyUsername == "user1");
    REQUIRE(options.proxyPassword == "pass1");

    REQUIRE_THROWS_AS(options.AddOption("hproxy-port", "0"), BaseOptions::BadValueException);
    REQUIRE_THROWS_AS(options.AddOption("hproxy-port", "65536"), BaseOptions::BadValueException);
    REQUIRE_THROWS_AS(options.AddOption("hproxy-port", "port"), BaseOptions::BadValueException);
    REQUIRE_THROWS_AS(options.AddOption("hproxy-port", "-1"), BaseOptions::BadValueException);
    REQUIRE_THROWS_AS(options.AddOption("hproxy-port", "80x"), BaseOptions::BadValueException);
    REQUIRE(options.proxyPort == 3128);

    REQUIRE(options.caFile.empty());
    REQUIRE(options.AddOption("ca-file", "/etc/ssl/certs/ca-certificates.crt"));
    REQUIRE(options.caFile == "/etc/ssl/certs/ca-certificates.crt");
    REQUIRE_THROWS_AS(options.AddOption("ca-file", ""), BaseOptions::BadValueException);

    REQUIRE(!options.AddOption("req-timeout", "5"));
}

/*****************************************************/
TEST_CASE("RunnerOptions", "[Options]")
{
    RunnerOptions options;
    REQUIRE(options.timeout == std::chrono::seconds(60));
    REQUIRE(options.connectTimeout == std::chrono::seconds(30));

    REQUIRE(options.AddOption("req-timeout", "15"));
    REQUIRE(options.timeout == std::chrono::seconds(15));
    REQUIRE(options.AddOption("connect-timeout", "5"));
    REQUIRE(options.connectTimeout == std::chrono::seconds(5));

    REQUIRE_THROWS_AS(options.AddOption("req-timeout", "0"), BaseOptions::BadValueException);
    REQUIRE_THROWS_AS(options.AddOption("req-timeout", "soon"), BaseOptions::BadValueException);
    REQUIRE_THROWS_AS(options.AddOption("req-timeout", "15s"), BaseOptions::BadValueException);
    REQUIRE_THROWS_AS(options.AddOption("connect-timeout", "-5"), BaseOptions::BadValueException);
    REQUIRE(options.timeout == std::chrono::seconds(15));

    REQUIRE(!options.AddOption("hproxy-host", "x"));
}

} // namespace Backend
} // namespace Cirrus
