#include "sqlforge/keyed_table.h"

namespace sqlforge::internal {

    boost::asio::thread_pool &paginationPool() {
        static boost::asio::thread_pool pool(4);
        return pool;
    }

    std::expected<std::uint64_t, Error> scalarToCount(const std::optional<QVariant> &scalar) {
        if (!scalar || scalar->isNull()) return 0;
        bool ok = false;
        const qulonglong count = scalar->toULongLong(&ok);
        if (!ok) return std::unexpected(Error(ErrorCode::MappingError, "COUNT result is not an integer: " + scalar->toString().toStdString()));
        return static_cast<std::uint64_t>(count);
    }

}  // namespace sqlforge::internal
