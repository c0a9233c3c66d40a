#include "sqlforge/delete_builder.h"
#include "sqlforge/insert_builder.h"
#include "sqlforge/select_builder.h"
#include "sqlforge/update_builder.h"

namespace sqlforge {

    template class SelectBuilder<sqlite::Value>;
    template class SelectBuilder<mysql::Value>;
    template class SelectBuilder<postgres::Value>;

    template class InsertBuilder<sqlite::Value>;
    template class InsertBuilder<mysql::Value>;
    template class InsertBuilder<postgres::Value>;

    template class UpdateBuilder<sqlite::Value>;
    template class UpdateBuilder<mysql::Value>;
    template class UpdateBuilder<postgres::Value>;

    template class DeleteBuilder<sqlite::Value>;
    template class DeleteBuilder<mysql::Value>;
    template class DeleteBuilder<postgres::Value>;

}  // namespace sqlforge
