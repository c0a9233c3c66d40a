#ifndef sqlforge_SQLFORGE_H
#define sqlforge_SQLFORGE_H

#include "sqlforge/builder_parts/aggregate.h"
#include "sqlforge/builder_parts/case_when.h"
#include "sqlforge/builder_parts/cte.h"
#include "sqlforge/builder_parts/join.h"
#include "sqlforge/builder_parts/sql_builder.h"
#include "sqlforge/builder_parts/subquery.h"
#include "sqlforge/composite_key_table.h"
#include "sqlforge/delete_builder.h"
#include "sqlforge/dialect.h"
#include "sqlforge/entity_macros.h"
#include "sqlforge/error.h"
#include "sqlforge/expr.h"
#include "sqlforge/fields.h"
#include "sqlforge/global_config.h"
#include "sqlforge/insert_builder.h"
#include "sqlforge/postgres/placeholder_rewriter.h"
#include "sqlforge/query_executor.h"
#include "sqlforge/relation.h"
#include "sqlforge/select_builder.h"
#include "sqlforge/single_key_table.h"
#include "sqlforge/table_query.h"
#include "sqlforge/transactional_executor.h"
#include "sqlforge/update_builder.h"

#endif  // sqlforge_SQLFORGE_H
