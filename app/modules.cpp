#include "modules.hpp"

#include <stdexcept>
#include <string_view>

using namespace tare::literals;

namespace tare::demo {

    namespace detail {

        inline constexpr uint32_t account_count = 64U;
        inline constexpr uint64_t initial_balance = 1'000'000U;

        static std::string account_key(uint32_t index) {
            return "balances/account/{}"_format(index);
        }

        static std::string item_key(uint32_t index) {
            return "kv/item/{:08}"_format(index);
        }

        static uint64_t read_balance(memory_storage& storage, uint32_t index) {
            auto raw = storage.get(account_key(index));
            if (!raw) {
                return 0U;
            }
            auto parsed = utils::parse_arithmetic<uint64_t>(*raw);
            if (!parsed) {
                throw std::runtime_error("corrupt balance for account {}: {}"_format(index, *raw));
            }
            return *parsed;
        }

        static void transfer(memory_storage& storage, uint32_t from, uint32_t to, uint64_t amount) {
            auto from_balance = read_balance(storage, from);
            if (from_balance < amount) {
                throw std::runtime_error("account {} cannot pay {}"_format(from, amount));
            }
            auto to_balance = read_balance(storage, to);
            storage.set(account_key(from), std::to_string(from_balance - amount));
            storage.set(account_key(to), std::to_string(to_balance + amount));
        }

        static void fill_items(memory_storage& storage, uint32_t count, size_t value_size = 32U) {
            for (uint32_t i = 0U; i < count; ++i) {
                storage.set(item_key(i), std::string(value_size, 'v'));
            }
        }

        static void check_total_issuance(trial_context& ctx) {
            uint64_t total{};
            for (uint32_t i = 0U; i < account_count; ++i) {
                total += read_balance(ctx.storage, i);
            }
            if (total != account_count * initial_balance) {
                throw std::runtime_error("total issuance changed to {}"_format(total));
            }
        }

    }  // namespace detail

    std::map<std::string, std::string> genesis() {
        std::map<std::string, std::string> state{};
        for (uint32_t i = 0U; i < detail::account_count; ++i) {
            state.emplace(detail::account_key(i), std::to_string(detail::initial_balance));
        }
        state.emplace("system/block_number", "1");
        return state;
    }

    std::vector<std::string> whitelisted_keys() {
        return {"system/block_number"};
    }

    void register_modules(registry& ops) {
        ops.add({.spec = {.module = "system", .name = "remark", .components = {{"b", 0U, 16'384U}}},
                 .body = [](trial_context& ctx) {
                     ctx.storage.get("system/block_number");
                     ctx.storage.set("system/last_remark", std::string(ctx.value("b"), 'r'));
                 }});

        ops.add({.spec = {.module = "system", .name = "noop"}, .body = [](trial_context&) {}});

        ops.add({.spec = {.module = "balances", .name = "transfer"},
                 .body = [](trial_context& ctx) { detail::transfer(ctx.storage, 0U, 1U, 10U); },
                 .verify = detail::check_total_issuance});

        ops.add({.spec = {.module = "balances",
                          .name = "transfer_many",
                          .components = {{"t", 1U, detail::account_count - 1U}}},
                 .body =
                         [](trial_context& ctx) {
                             auto transfers = ctx.value("t");
                             for (uint32_t i = 0U; i < transfers && !ctx.stop.stop_requested(); ++i) {
                                 detail::transfer(ctx.storage, 0U, i + 1U, 1U);
                             }
                         },
                 .verify = detail::check_total_issuance});

        ops.add({.spec = {.module = "kv", .name = "insert_many", .components = {{"n", 0U, 1'000U}}},
                 .body =
                         [](trial_context& ctx) {
                             auto n = ctx.value("n");
                             for (uint32_t i = 0U; i < n && !ctx.stop.stop_requested(); ++i) {
                                 ctx.storage.set(detail::item_key(i), std::string(32U, 'v'));
                             }
                         },
                 .verify =
                         [](trial_context& ctx) {
                             auto n = ctx.value("n");
                             if (n > 0U && !ctx.storage.contains(detail::item_key(n - 1U))) {
                                 throw std::runtime_error("last inserted item missing");
                             }
                         }});

        ops.add({.spec = {.module = "kv",
                          .name = "read_write",
                          .components = {{"r", 0U, 500U}, {"w", 0U, 500U}}},
                 .setup = [](trial_context& ctx) { detail::fill_items(ctx.storage, ctx.value("r")); },
                 .body =
                         [](trial_context& ctx) {
                             for (uint32_t i = 0U; i < ctx.value("r"); ++i) {
                                 ctx.storage.get(detail::item_key(i));
                             }
                             for (uint32_t i = 0U; i < ctx.value("w"); ++i) {
                                 ctx.storage.set("kv/out/{}"_format(i), std::string(16U, 'w'));
                             }
                         }});

        ops.add({.spec = {.module = "kv", .name = "clear_prefix", .components = {{"n", 0U, 1'000U}}},
                 .setup = [](trial_context& ctx) { detail::fill_items(ctx.storage, ctx.value("n")); },
                 .body = [](trial_context& ctx) { ctx.storage.clear_prefix("kv/item/"); },
                 .verify =
                         [](trial_context& ctx) {
                             if (ctx.storage.contains(detail::item_key(0U))) {
                                 throw std::runtime_error("items survived clear_prefix");
                             }
                         }});

        ops.add({.spec = {.module = "kv",
                          .name = "rewrite_large",
                          .components = {{"n", 1U, 64U}, {"s", 1'024U, 65'536U}},
                          .extra = true},
                 .setup = [](trial_context& ctx) { detail::fill_items(ctx.storage, ctx.value("n"), ctx.value("s")); },
                 .body =
                         [](trial_context& ctx) {
                             for (uint32_t i = 0U; i < ctx.value("n"); ++i) {
                                 auto value = ctx.storage.get(detail::item_key(i)).value_or(std::string{});
                                 value.append("x");
                                 ctx.storage.set(detail::item_key(i), std::move(value));
                             }
                         }});
    }

}  // namespace tare::demo
