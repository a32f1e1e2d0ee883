#include "gridsync/read/pagination.hpp"

#include <algorithm>
#include <charconv>
#include <thread>

#include "gridsync/error.hpp"
#include "gridsync/logging.hpp"

namespace gridsync::read {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string encode_cursor(const RowKey& key) {
    static const char kHex[] = "0123456789abcdef";
    std::string raw = std::to_string(key.created_at_us) + ":" + key.id;
    std::string out;
    out.reserve(raw.size() * 2);
    for (unsigned char c : raw) {
        out += kHex[c >> 4];
        out += kHex[c & 0xF];
    }
    return out;
}

std::optional<RowKey> decode_cursor(std::string_view cursor) {
    if (cursor.empty() || cursor.size() % 2 != 0) return std::nullopt;

    std::string raw;
    raw.reserve(cursor.size() / 2);
    for (size_t i = 0; i < cursor.size(); i += 2) {
        int hi = hex_value(cursor[i]);
        int lo = hex_value(cursor[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        raw += static_cast<char>((hi << 4) | lo);
    }

    size_t colon = raw.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == raw.size()) return std::nullopt;

    RowKey key;
    const char* first = raw.data();
    const char* last = raw.data() + colon;
    auto [ptr, ec] = std::from_chars(first, last, key.created_at_us);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    key.id = raw.substr(colon + 1);
    return key;
}

template <typename Fn>
auto PaginationEngine::with_retry(const char* what, Fn&& fn) -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const TransientStoreError& e) {
            if (options_.read_retry.exhausted(attempt)) throw;
            auto delay = options_.read_retry.delay(attempt);
            LOG_WARN(what, " failed (attempt ", attempt, "), retrying in ", delay.count(), "ms: ", e.message());
            std::this_thread::sleep_for(delay);
        }
    }
}

Page PaginationEngine::get_page(const std::string& user_id, const std::string& table_id,
                                const std::optional<std::string>& cursor, std::optional<size_t> limit) {
    std::optional<RowKey> after;
    if (cursor && !cursor->empty()) {
        after = decode_cursor(*cursor);
        if (!after) {
            LOG_DEBUG("Malformed cursor for table ", table_id, ", reading first page");
        }
    }

    Page page;
    page.total_count = with_retry("count_rows", [&] { return tables_.count_rows(user_id, table_id); });

    size_t page_size;
    if (limit && *limit > 0) {
        page_size = *limit;
    } else if (!after) {
        page_size = options_.first_page_size;
    } else {
        page_size = static_cast<size_t>(std::max<int64_t>(page.total_count, 1));
    }
    page_size = std::min(page_size, options_.max_page_size);

    page.rows = with_retry("fetch_rows_after", [&] {
        return tables_.fetch_rows_after(user_id, table_id, after, page_size + 1);
    });

    if (page.rows.size() > page_size) {
        page.rows.resize(page_size);
        page.has_more = true;
        page.next_cursor = encode_cursor(key_of(page.rows.back()));
    }
    return page;
}

} // namespace gridsync::read
