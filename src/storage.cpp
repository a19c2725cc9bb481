#include "tare/storage.hpp"

#include <utility>

namespace tare {

    memory_storage::memory_storage(std::map<std::string, std::string> genesis) {
        for (auto& [key, value] : genesis) {
            genesis_.emplace(key, std::move(value));
        }
    }

    std::optional<std::string> memory_storage::lookup(std::string_view key, bool& from_committed) const {
        from_committed = false;
        if (auto it = trial_.find(key); it != trial_.end()) {
            return it->second;
        }
        from_committed = true;
        if (auto it = setup_.find(key); it != setup_.end()) {
            return it->second;
        }
        if (auto it = genesis_.find(key); it != genesis_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    void memory_storage::note_read(
            std::string_view key, const std::optional<std::string>& value, bool from_committed) {
        if (!in_trial_ || whitelist_.contains(key) || written_keys_.contains(key)) {
            return;
        }
        if (!read_keys_.emplace(key).second) {
            return;
        }
        ++counters_.reads;
        if (from_committed) {
            counters_.proof_size += key.size() + (value ? value->size() : 0U);
        }
    }

    void memory_storage::note_write(std::string_view key) {
        if (!in_trial_ || whitelist_.contains(key)) {
            return;
        }
        if (written_keys_.emplace(key).second) {
            ++counters_.writes;
        }
    }

    std::optional<std::string> memory_storage::get(std::string_view key) {
        bool from_committed = false;
        auto value = lookup(key, from_committed);
        note_read(key, value, from_committed);
        return value;
    }

    bool memory_storage::contains(std::string_view key) {
        return get(key).has_value();
    }

    void memory_storage::set(std::string_view key, std::string value) {
        note_write(key);
        active_layer().insert_or_assign(std::string{key}, std::optional<std::string>{std::move(value)});
    }

    void memory_storage::erase(std::string_view key) {
        note_write(key);
        active_layer().insert_or_assign(std::string{key}, std::optional<std::string>{});
    }

    size_t memory_storage::clear_prefix(std::string_view prefix) {
        std::set<std::string, std::less<>> visible{};
        auto collect = [&](const auto& map) {
            for (auto it = map.lower_bound(prefix); it != map.end() && it->first.starts_with(prefix); ++it) {
                visible.insert(it->first);
            }
        };
        collect(genesis_);
        collect(setup_);
        collect(trial_);

        size_t removed = 0U;
        for (const auto& key : visible) {
            bool from_committed = false;
            if (lookup(key, from_committed)) {
                erase(key);
                ++removed;
            }
        }
        return removed;
    }

    void memory_storage::whitelist(std::string key) {
        whitelist_.insert(std::move(key));
    }

    void memory_storage::begin_trial() {
        in_trial_ = true;
        trial_.clear();
        read_keys_.clear();
        written_keys_.clear();
        counters_ = {};
    }

    void memory_storage::rollback() {
        in_trial_ = false;
        setup_.clear();
        trial_.clear();
        read_keys_.clear();
        written_keys_.clear();
        counters_ = {};
    }

    size_t memory_storage::size() const {
        size_t count = 0U;
        for (const auto& [key, value] : genesis_) {
            if (!trial_.contains(key) && !setup_.contains(key)) {
                ++count;
            }
        }
        for (const auto& [key, value] : setup_) {
            if (!trial_.contains(key) && value) {
                ++count;
            }
        }
        for (const auto& [key, value] : trial_) {
            if (value) {
                ++count;
            }
        }
        return count;
    }

}  // namespace tare
