/*
 * Maven dependency lookup - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace ideshell {

struct HttpResponse {
    long status = 0;        // HTTP status, 0 if the request never completed
    std::string body;
    std::string error;      // transport error text
};

class HttpFetcher {
public:
    virtual ~HttpFetcher() = default;
    virtual HttpResponse get(const std::string& url) = 0;
};

// Blocking GET over libcurl.
class CurlHttpFetcher : public HttpFetcher {
public:
    explicit CurlHttpFetcher(int timeout_seconds = 5) : m_timeout(timeout_seconds) {}
    HttpResponse get(const std::string& url) override;
private:
    int m_timeout;
};

struct MavenCoordinate {
    std::string group;
    std::string artifact;
    std::string version;    // may be empty
    std::string to_string() const;
};

// group:artifact[:version]
std::optional<MavenCoordinate> parse_coordinate(const std::string& text);

// <repo>/<group with / for .>/<artifact>/maven-metadata.xml
std::string metadata_url(const std::string& repository, const MavenCoordinate& c);

// <release>, else <latest>, else the last <version>.
std::optional<std::string> parse_latest_version(const std::string& metadata_xml);

struct VersionLookup {
    std::optional<std::string> version;
    std::string reason;     // why version is empty
};

VersionLookup latest_version(HttpFetcher& http, const std::string& repository, const MavenCoordinate& c);

// String-literal coordinates in a build.gradle / build.gradle.kts
// (implementation "g:a:v", api('g:a:v'), ...), in order of appearance.
std::vector<MavenCoordinate> scan_gradle_coordinates(const std::string& script);

// Numeric-aware comparison: <0, 0, >0. "1.10" > "1.9"; "1.0" > "1.0-rc1".
int compare_versions(const std::string& a, const std::string& b);

} // namespace ideshell
