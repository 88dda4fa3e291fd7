/*
 * Command history and bookmarks - IDE-Shell
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ideshell {

// Per-session list of executed commands, most recent last. previous()/next()
// only move a cursor; the list itself changes only through append().
class CommandHistory {
public:
    void append(const std::string& command);   // also resets the cursor past the newest entry
    const std::vector<std::string>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    size_t cursor() const { return m_cursor; }

    std::optional<std::string> previous();     // stops at the oldest entry
    std::optional<std::string> next();         // nullopt once past the newest entry
    void reset_cursor() { m_cursor = m_entries.size(); }
private:
    std::vector<std::string> m_entries;
    size_t m_cursor = 0;
};

struct CommandHistoryEntry {
    std::string command;
    std::string description;
    std::vector<std::string> tags;
    bool favorite = false;
    int use_count = 0;
    std::int64_t last_used = 0;                 // epoch milliseconds, 0 = never
};
using BookmarkedCommand = CommandHistoryEntry;

std::int64_t now_epoch_ms();

// Durable history and bookmarks shared by every session. Implementations
// must be safe for concurrent calls.
class HistoryStore {
public:
    virtual ~HistoryStore() = default;
    virtual void record(const std::string& command) = 0;
    virtual std::vector<CommandHistoryEntry> recent(size_t limit) const = 0;   // newest first

    // Replaces an existing bookmark with the same command.
    virtual void add_bookmark(const BookmarkedCommand& bookmark) = 0;
    virtual bool remove_bookmark(const std::string& command) = 0;
    virtual std::optional<BookmarkedCommand> find_bookmark(const std::string& command) const = 0;
    virtual std::vector<BookmarkedCommand> bookmarks() const = 0;  // favorites first, then most used
    // Bumps use count and last-used time; false if there is no such bookmark.
    virtual bool increment_use_count(const std::string& command) = 0;
};

class InMemoryHistoryStore : public HistoryStore {
public:
    void record(const std::string& command) override;
    std::vector<CommandHistoryEntry> recent(size_t limit) const override;
    void add_bookmark(const BookmarkedCommand& bookmark) override;
    bool remove_bookmark(const std::string& command) override;
    std::optional<BookmarkedCommand> find_bookmark(const std::string& command) const override;
    std::vector<BookmarkedCommand> bookmarks() const override;
    bool increment_use_count(const std::string& command) override;
protected:
    mutable std::mutex m_mutex;
    std::vector<CommandHistoryEntry> m_history;
    std::vector<BookmarkedCommand> m_bookmarks;
};

// Keeps bookmarks in a tab-separated file, rewritten after every change:
// command, description, tags (comma list), favorite, use count, last used.
class FileBookmarkStore : public InMemoryHistoryStore {
public:
    explicit FileBookmarkStore(std::string path) : m_path(std::move(path)) {}
    bool load();        // false if the file cannot be read; malformed lines are skipped
    bool save() const;
    const std::string& path() const { return m_path; }

    void add_bookmark(const BookmarkedCommand& bookmark) override;
    bool remove_bookmark(const std::string& command) override;
    bool increment_use_count(const std::string& command) override;
private:
    std::string m_path;
    mutable std::mutex m_save_mutex;
};

std::string format_bookmark_line(const BookmarkedCommand& b);
std::optional<BookmarkedCommand> parse_bookmark_line(const std::string& line);

} // namespace ideshell
