#include "adapters/secondary/persistence/JsonFileSnapshotStore.hpp"
#include "adapters/secondary/persistence/JsonSnapshotCodec.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace ledger::adapters::secondary {

JsonFileSnapshotStore::JsonFileSnapshotStore(fs::path path)
    : path_(std::move(path))
{
    std::cout << "[JsonFileSnapshotStore] Using " << path_.string() << std::endl;
}

void JsonFileSnapshotStore::save(const domain::LedgerState& state) {
    const std::string content = JsonSnapshotCodec::encode(state);

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;

    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw domain::PersistenceIoError(location(),
                "cannot create directory " + path_.parent_path().string() + ": " + ec.message());
        }
    }

    const fs::path tmp = tempPath();
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw domain::PersistenceIoError(location(), "cannot open " + tmp.string() + " for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw domain::PersistenceIoError(location(), "write to " + tmp.string() + " failed");
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw domain::PersistenceIoError(location(), "cannot replace snapshot: " + reason);
    }

    std::cout << "[JsonFileSnapshotStore] Saved " << state.accounts.size()
              << " accounts to " << path_.string() << std::endl;
}

domain::LedgerState JsonFileSnapshotStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;

    const bool present = fs::exists(path_, ec);
    if (ec) {
        throw domain::PersistenceIoError(location(), ec.message());
    }
    if (!present) {
        std::cout << "[JsonFileSnapshotStore] No existing data file found at "
                  << path_.string() << std::endl;
        return domain::LedgerState::empty();
    }
    if (!fs::is_regular_file(path_, ec)) {
        throw domain::PersistenceIoError(location(), "not a regular file");
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw domain::PersistenceIoError(location(), "cannot open for reading");
    }

    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        throw domain::PersistenceIoError(location(), "read failed");
    }

    auto state = JsonSnapshotCodec::decode(content.str(), location());
    std::cout << "[JsonFileSnapshotStore] Loaded " << state.accounts.size()
              << " accounts from " << path_.string() << std::endl;
    return state;
}

bool JsonFileSnapshotStore::exists() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    return fs::exists(path_, ec);
}

std::string JsonFileSnapshotStore::location() const {
    return path_.string();
}

void JsonFileSnapshotStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        throw domain::PersistenceIoError(location(), "cannot remove snapshot: " + ec.message());
    }
}

fs::path JsonFileSnapshotStore::tempPath() const {
    fs::path tmp = path_;
    tmp += ".tmp";
    return tmp;
}

} // namespace ledger::adapters::secondary
