#ifndef sqlforge_POSTGRES_PLACEHOLDER_REWRITER_H
#define sqlforge_POSTGRES_PLACEHOLDER_REWRITER_H

#include <string>
#include <string_view>

namespace sqlforge::postgres {

    // 从左到右把每个 ? 依次改写为 $1, $2, ... $N
    // 引号内的字面量, -- 与 /* */ 注释中的 ? 保持不变
    std::string rewritePlaceholders(std::string_view sql);

}  // namespace sqlforge::postgres

#endif  // sqlforge_POSTGRES_PLACEHOLDER_REWRITER_H
