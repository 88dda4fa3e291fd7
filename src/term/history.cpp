/*
 * Command history and bookmarks implementation - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <ide-shell/term/history.hpp>
#include <ide-shell/log/log.hpp>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace ideshell {

void CommandHistory::append(const std::string& command) {
    m_entries.push_back(command);
    m_cursor = m_entries.size();
}

std::optional<std::string> CommandHistory::previous() {
    if (m_entries.empty()) return std::nullopt;
    if (m_cursor > 0) --m_cursor;
    return m_entries[m_cursor];
}

std::optional<std::string> CommandHistory::next() {
    if (m_cursor + 1 < m_entries.size()) return m_entries[++m_cursor];
    m_cursor = m_entries.size();
    return std::nullopt;
}

std::int64_t now_epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void InMemoryHistoryStore::record(const std::string& command) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = std::find_if(m_history.begin(), m_history.end(), [&](auto& e){ return e.command == command; });
    CommandHistoryEntry e;
    if (it != m_history.end()) { e = *it; m_history.erase(it); }
    else e.command = command;
    ++e.use_count;
    e.last_used = now_epoch_ms();
    m_history.push_back(std::move(e));
}

std::vector<CommandHistoryEntry> InMemoryHistoryStore::recent(size_t limit) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    std::vector<CommandHistoryEntry> out;
    for (auto it = m_history.rbegin(); it != m_history.rend() && out.size() < limit; ++it) out.push_back(*it);
    return out;
}

void InMemoryHistoryStore::add_bookmark(const BookmarkedCommand& bookmark) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = std::find_if(m_bookmarks.begin(), m_bookmarks.end(), [&](auto& b){ return b.command == bookmark.command; });
    if (it != m_bookmarks.end()) *it = bookmark;
    else m_bookmarks.push_back(bookmark);
}

bool InMemoryHistoryStore::remove_bookmark(const std::string& command) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = std::find_if(m_bookmarks.begin(), m_bookmarks.end(), [&](auto& b){ return b.command == command; });
    if (it == m_bookmarks.end()) return false;
    m_bookmarks.erase(it);
    return true;
}

std::optional<BookmarkedCommand> InMemoryHistoryStore::find_bookmark(const std::string& command) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    for (auto& b : m_bookmarks) if (b.command == command) return b;
    return std::nullopt;
}

std::vector<BookmarkedCommand> InMemoryHistoryStore::bookmarks() const {
    std::vector<BookmarkedCommand> out;
    { std::lock_guard<std::mutex> lk(m_mutex); out = m_bookmarks; }
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b){
        if (a.favorite != b.favorite) return a.favorite;
        return a.use_count > b.use_count;
    });
    return out;
}

bool InMemoryHistoryStore::increment_use_count(const std::string& command) {
    std::lock_guard<std::mutex> lk(m_mutex);
    for (auto& b : m_bookmarks) {
        if (b.command != command) continue;
        ++b.use_count;
        b.last_used = now_epoch_ms();
        return true;
    }
    return false;
}

// Tabs, newlines and backslashes are escaped so every record stays on one line.
static std::string escape_field(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

static std::string unescape_field(const std::string& s) {
    std::string out;
    for (size_t i=0;i<s.size();++i) {
        if (s[i]=='\\' && i+1<s.size()) {
            char n = s[++i];
            out.push_back(n=='t' ? '\t' : n=='n' ? '\n' : n);
        } else out.push_back(s[i]);
    }
    return out;
}

// Tags are joined with ','; a comma or backslash inside a tag is backslash-escaped.
static std::string join_tags(const std::vector<std::string>& tags) {
    std::string out;
    for (size_t i=0;i<tags.size();++i) {
        if (i) out += ',';
        for (char c : tags[i]) {
            if (c == ',' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
    }
    return out;
}

static std::vector<std::string> split_tags(const std::string& s) {
    std::vector<std::string> tags;
    std::string cur;
    for (size_t i=0;i<s.size();++i) {
        if (s[i] == '\\' && i+1 < s.size()) cur.push_back(s[++i]);
        else if (s[i] == ',') { if (!cur.empty()) tags.push_back(cur); cur.clear(); }
        else cur.push_back(s[i]);
    }
    if (!cur.empty()) tags.push_back(cur);
    return tags;
}

std::string format_bookmark_line(const BookmarkedCommand& b) {
    std::string tags = join_tags(b.tags);
    return escape_field(b.command) + '\t' + escape_field(b.description) + '\t' + escape_field(tags) + '\t'
        + (b.favorite ? "1" : "0") + '\t' + std::to_string(b.use_count) + '\t' + std::to_string(b.last_used);
}

std::optional<BookmarkedCommand> parse_bookmark_line(const std::string& line) {
    std::vector<std::string> f;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        f.push_back(line.substr(start, tab == std::string::npos ? std::string::npos : tab - start));
        if (tab == std::string::npos) break;
        start = tab + 1;
    }
    if (f.size() != 6 || f[0].empty()) return std::nullopt;
    BookmarkedCommand b;
    b.command = unescape_field(f[0]);
    b.description = unescape_field(f[1]);
    b.tags = split_tags(unescape_field(f[2]));
    if (f[3] != "0" && f[3] != "1") return std::nullopt;
    b.favorite = f[3] == "1";
    try {
        size_t used = 0;
        b.use_count = std::stoi(f[4], &used);
        if (used != f[4].size() || b.use_count < 0) return std::nullopt;
        b.last_used = std::stoll(f[5], &used);
        if (used != f[5].size()) return std::nullopt;
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return b;
}

bool FileBookmarkStore::load() {
    std::ifstream in(m_path);
    if (!in) return false;
    std::vector<BookmarkedCommand> loaded;
    std::string line; size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.empty()) continue;
        auto b = parse_bookmark_line(line);
        if (!b) { log_warn(m_path + ":" + std::to_string(lineno) + ": malformed bookmark skipped"); continue; }
        loaded.push_back(*b);
    }
    std::lock_guard<std::mutex> lk(m_mutex);
    m_bookmarks = std::move(loaded);
    return true;
}

bool FileBookmarkStore::save() const {
    // Held from snapshot to rename so an older snapshot never replaces a newer file.
    std::lock_guard<std::mutex> save_lk(m_save_mutex);
    std::vector<BookmarkedCommand> snapshot;
    { std::lock_guard<std::mutex> lk(m_mutex); snapshot = m_bookmarks; }
    std::error_code ec;
    auto parent = std::filesystem::path(m_path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    std::string tmp = m_path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) { log_warn("cannot write " + tmp); return false; }
        for (auto& b : snapshot) out << format_bookmark_line(b) << '\n';
        if (!out) { log_warn("cannot write " + tmp); return false; }
    }
    std::filesystem::rename(tmp, m_path, ec);
    if (ec) { log_warn("cannot replace " + m_path + ": " + ec.message()); return false; }
    return true;
}

void FileBookmarkStore::add_bookmark(const BookmarkedCommand& bookmark) {
    InMemoryHistoryStore::add_bookmark(bookmark);
    save();
}

bool FileBookmarkStore::remove_bookmark(const std::string& command) {
    if (!InMemoryHistoryStore::remove_bookmark(command)) return false;
    save();
    return true;
}

bool FileBookmarkStore::increment_use_count(const std::string& command) {
    if (!InMemoryHistoryStore::increment_use_count(command)) return false;
    save();
    return true;
}

} // namespace ideshell
