#include "sqlforge/postgres/placeholder_rewriter.h"

namespace sqlforge::postgres {

    std::string rewritePlaceholders(std::string_view sql) {
        std::string rewritten;
        rewritten.reserve(sql.size() + 16);
        std::size_t index = 0;
        std::size_t i = 0;
        while (i < sql.size()) {
            const char c = sql[i];
            // 'x' 与 "x": 复写到配对的引号; '' 会依次闭合再重新打开
            if (c == '\'' || c == '"') {
                std::size_t end = sql.find(c, i + 1);
                end = end == std::string_view::npos ? sql.size() : end + 1;
                rewritten.append(sql.substr(i, end - i));
                i = end;
                continue;
            }
            if (c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') {
                std::size_t end = sql.find('\n', i);
                end = end == std::string_view::npos ? sql.size() : end;
                rewritten.append(sql.substr(i, end - i));
                i = end;
                continue;
            }
            if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
                std::size_t end = sql.find("*/", i + 2);
                end = end == std::string_view::npos ? sql.size() : end + 2;
                rewritten.append(sql.substr(i, end - i));
                i = end;
                continue;
            }
            if (c == '?') {
                rewritten += '$';
                rewritten += std::to_string(++index);
            } else {
                rewritten += c;
            }
            ++i;
        }
        return rewritten;
    }

}  // namespace sqlforge::postgres
