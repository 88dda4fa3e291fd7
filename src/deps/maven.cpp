/*
 * Maven dependency lookup implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/deps/maven.hpp>
#include <ide-shell/log/log.hpp>
#include <algorithm>
#include <cctype>
#include <regex>

namespace ideshell {

std::string MavenCoordinate::to_string() const {
    return version.empty() ? group + ":" + artifact : group + ":" + artifact + ":" + version;
}

std::optional<MavenCoordinate> parse_coordinate(const std::string& text) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t c = text.find(':', start);
        parts.push_back(text.substr(start, c == std::string::npos ? std::string::npos : c - start));
        if (c == std::string::npos) break;
        start = c + 1;
    }
    if (parts.size() < 2 || parts.size() > 3) return std::nullopt;
    for (auto& p : parts) {
        if (p.empty()) return std::nullopt;
        for (char ch : p) if (std::isspace((unsigned char)ch) || ch=='/' || ch=='"' || ch=='\'') return std::nullopt;
    }
    MavenCoordinate c{parts[0], parts[1], parts.size() == 3 ? parts[2] : ""};
    return c;
}

std::string metadata_url(const std::string& repository, const MavenCoordinate& c) {
    std::string base = repository;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string group = c.group;
    for (auto& ch : group) if (ch == '.') ch = '/';
    return base + "/" + group + "/" + c.artifact + "/maven-metadata.xml";
}

// Text of every <tag>...</tag> element, in document order.
static std::vector<std::string> element_texts(const std::string& xml, const std::string& tag) {
    std::vector<std::string> out;
    std::string open = "<" + tag + ">", close = "</" + tag + ">";
    size_t pos = 0;
    while ((pos = xml.find(open, pos)) != std::string::npos) {
        size_t begin = pos + open.size();
        size_t end = xml.find(close, begin);
        if (end == std::string::npos) break;
        std::string v = xml.substr(begin, end - begin);
        size_t a = v.find_first_not_of(" \t\r\n"), b = v.find_last_not_of(" \t\r\n");
        out.push_back(a == std::string::npos ? std::string() : v.substr(a, b - a + 1));
        pos = end + close.size();
    }
    return out;
}

std::optional<std::string> parse_latest_version(const std::string& xml) {
    for (auto tag : {"release", "latest"}) {
        auto v = element_texts(xml, tag);
        if (!v.empty() && !v.front().empty()) return v.front();
    }
    auto versions = element_texts(xml, "version");
    while (!versions.empty() && versions.back().empty()) versions.pop_back();
    if (versions.empty()) return std::nullopt;
    return versions.back();
}

VersionLookup latest_version(HttpFetcher& http, const std::string& repository, const MavenCoordinate& c) {
    VersionLookup res;
    std::string url = metadata_url(repository, c);
    log_debug("GET " + url);
    HttpResponse r = http.get(url);
    if (!r.error.empty()) { res.reason = "request failed: " + r.error; return res; }
    if (r.status / 100 != 2) { res.reason = "HTTP " + std::to_string(r.status) + " for " + url; return res; }
    res.version = parse_latest_version(r.body);
    if (!res.version) res.reason = "no version in metadata for " + c.group + ":" + c.artifact;
    return res;
}

std::vector<MavenCoordinate> scan_gradle_coordinates(const std::string& script) {
    static const std::regex literal(R"re(["']([A-Za-z0-9_.\-]+:[A-Za-z0-9_.\-]+:[A-Za-z0-9_.+\-]+)["'])re");
    std::vector<MavenCoordinate> out;
    for (auto it = std::sregex_iterator(script.begin(), script.end(), literal); it != std::sregex_iterator(); ++it) {
        if (auto c = parse_coordinate((*it)[1].str())) out.push_back(*c);
    }
    return out;
}

// Splits "1.10.0-rc1" into ("1.10.0", "rc1").
static std::pair<std::string,std::string> split_qualifier(const std::string& v) {
    size_t dash = v.find('-');
    if (dash == std::string::npos) return {v, ""};
    return {v.substr(0, dash), v.substr(dash + 1)};
}

int compare_versions(const std::string& a, const std::string& b) {
    auto [na, qa] = split_qualifier(a);
    auto [nb, qb] = split_qualifier(b);
    size_t i = 0, j = 0;
    while (i < na.size() || j < nb.size()) {
        size_t ei = na.find('.', i), ej = nb.find('.', j);
        std::string pa = i < na.size() ? na.substr(i, ei == std::string::npos ? std::string::npos : ei - i) : "0";
        std::string pb = j < nb.size() ? nb.substr(j, ej == std::string::npos ? std::string::npos : ej - j) : "0";
        bool da = !pa.empty() && pa.find_first_not_of("0123456789") == std::string::npos;
        bool db = !pb.empty() && pb.find_first_not_of("0123456789") == std::string::npos;
        if (da && db) {
            // numeric segments of any length: drop leading zeros, then longer wins
            pa.erase(0, std::min(pa.find_first_not_of('0'), pa.size()));
            pb.erase(0, std::min(pb.find_first_not_of('0'), pb.size()));
            if (pa.size() != pb.size()) return pa.size() < pb.size() ? -1 : 1;
            if (int c = pa.compare(pb); c != 0) return c < 0 ? -1 : 1;
        } else if (int c = pa.compare(pb); c != 0) {
            return c < 0 ? -1 : 1;
        }
        i = (ei == std::string::npos || i >= na.size()) ? na.size() : ei + 1;
        j = (ej == std::string::npos || j >= nb.size()) ? nb.size() : ej + 1;
    }
    if (qa == qb) return 0;
    if (qa.empty()) return 1;   // a release sorts after its pre-releases
    if (qb.empty()) return -1;
    int c = qa.compare(qb);
    return c < 0 ? -1 : 1;
}

} // namespace ideshell
