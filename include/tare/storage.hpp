#pragma once

#include "types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace tare {

    /*
     * Instrumented in-memory key/value backend.
     *
     * Three layers, looked up top-down: trial (writes made by the measured call), setup (writes made
     * while preparing the trial) and genesis (state shared by every trial). `begin_trial` moves the
     * boundary from setup to trial and zeroes the counters; `rollback` drops both upper layers.
     *
     * Counting: a read is counted once per distinct key unless the trial already wrote it; a write
     * once per distinct key. Proof size is the key plus value bytes of every distinct key read from
     * committed (setup or genesis) state. Whitelisted keys are never counted.
     */
    class memory_storage {
      public:
        memory_storage() = default;
        explicit memory_storage(std::map<std::string, std::string> genesis);

        std::optional<std::string> get(std::string_view key);
        bool contains(std::string_view key);
        void set(std::string_view key, std::string value);
        void erase(std::string_view key);
        // Erases every visible key starting with `prefix`; returns the number removed
        size_t clear_prefix(std::string_view prefix);

        void whitelist(std::string key);

        void begin_trial();
        void rollback();

        storage_counters counters() const { return counters_; }
        bool in_trial() const { return in_trial_; }

        // Visible size of the store; uncounted
        size_t size() const;

      private:
        using layer = std::map<std::string, std::optional<std::string>, std::less<>>;

        std::optional<std::string> lookup(std::string_view key, bool& from_committed) const;
        void note_read(std::string_view key, const std::optional<std::string>& value, bool from_committed);
        void note_write(std::string_view key);
        layer& active_layer() { return in_trial_ ? trial_ : setup_; }

        std::map<std::string, std::string, std::less<>> genesis_{};
        layer setup_{};
        layer trial_{};
        bool in_trial_{false};

        std::set<std::string, std::less<>> whitelist_{};
        std::set<std::string, std::less<>> read_keys_{};
        std::set<std::string, std::less<>> written_keys_{};
        storage_counters counters_{};
    };

}  // namespace tare
