#ifndef SGATE_BAN_STORE_HPP
#define SGATE_BAN_STORE_HPP

#include "sgate_util.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward declaration; only ban_store.cpp sees the sqlite3 API
struct sqlite3;

namespace sgate {

enum class BanState { CLEAN, WATCHED, BANNED, EXPIRED };

const char* ban_state_to_string(BanState s) noexcept;
std::optional<BanState> ban_state_from_string(const std::string& s);

struct BanRecord {
    std::string ip;
    uint32_t hits = 0;
    uint32_t level = 0;
    BanState state = BanState::CLEAN;
    std::optional<TimePoint> expiry;
    std::optional<TimePoint> first_failure;
    std::optional<TimePoint> last_failure;
    bool whitelisted = false;
};

/**
 * @brief Repository for per-IP ban state
 *
 * The engine is the only writer and serializes access per IP; stores only
 * need to be safe for concurrent calls on different keys.
 * Failures throw IOError.
 */
class BanStore {
public:
    virtual ~BanStore() = default;

    virtual std::optional<BanRecord> load(const std::string& ip) = 0;
    virtual void save(const BanRecord& record) = 0;
    virtual void erase(const std::string& ip) = 0;
    virtual std::vector<BanRecord> all() = 0;
};

class MemoryBanStore : public BanStore {
public:
    std::optional<BanRecord> load(const std::string& ip) override;
    void save(const BanRecord& record) override;
    void erase(const std::string& ip) override;
    std::vector<BanRecord> all() override;

private:
    std::mutex mutex_;
    std::map<std::string, BanRecord> records_;
};

/**
 * @brief sqlite3-backed store, table `ban_records`
 *
 * State survives daemon restarts and is shared with one-shot CLI calls
 * (`sgate ban status`). Opened in WAL mode with a busy timeout.
 */
class SqliteBanStore : public BanStore {
public:
    /// @throws IOError if the database cannot be opened or initialized
    explicit SqliteBanStore(const std::string& db_path);
    ~SqliteBanStore() override;

    SqliteBanStore(const SqliteBanStore&) = delete;
    SqliteBanStore& operator=(const SqliteBanStore&) = delete;

    std::optional<BanRecord> load(const std::string& ip) override;
    void save(const BanRecord& record) override;
    void erase(const std::string& ip) override;
    std::vector<BanRecord> all() override;

    const std::string& path() const { return db_path_; }

private:
    void execute(const std::string& sql);
    [[noreturn]] void fail(const std::string& what);

    sqlite3* db_handle_;
    std::string db_path_;
    std::mutex mutex_;
};

} // namespace sgate

#endif // SGATE_BAN_STORE_HPP
