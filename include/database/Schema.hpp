#pragma once

#include <string>
#include <vector>

namespace pqxx {
class connection;
}

namespace cw::database::schema {

// CREATE ... IF NOT EXISTS for every table and index, in dependency order
void init_tables_if_not_exists(pqxx::connection& conn);

std::vector<std::string> missing_tables(pqxx::connection& conn);

// Empties every table and restarts id sequences; test databases only
void wipe_all_data_restart_identity(pqxx::connection& conn);

}
