#include "internal/db/sql/registry_schema.hpp"

namespace catalog::db::sql {

const std::vector<Migration>& RegistryMigrations() {
  static const std::vector<Migration> kMigrations = {
      {0,
       "initial",
       {
           "CREATE TABLE IF NOT EXISTS operatorbundle (name TEXT PRIMARY KEY, csv TEXT, bundle TEXT);",
           "CREATE TABLE IF NOT EXISTS package (name TEXT PRIMARY KEY, default_channel TEXT);",
           "CREATE TABLE IF NOT EXISTS channel (name TEXT, package_name TEXT, head_operatorbundle_name TEXT, PRIMARY KEY(name, package_name));",
           "CREATE TABLE IF NOT EXISTS channel_entry (entry_id INTEGER PRIMARY KEY, channel_name TEXT, package_name TEXT, operatorbundle_name TEXT, "
           "replaces INTEGER, depth INTEGER);",
           "CREATE TABLE IF NOT EXISTS api (group_name TEXT, version TEXT, kind TEXT, plural TEXT NOT NULL, PRIMARY KEY(group_name, version, kind));",
           "CREATE TABLE IF NOT EXISTS related_image (image TEXT, operatorbundle_name TEXT);",
       }},
      {1,
       "bundlepath",
       {
           "ALTER TABLE operatorbundle ADD COLUMN bundlepath TEXT;",
       }},
      {2,
       "version_skiprange",
       {
           "ALTER TABLE operatorbundle ADD COLUMN version TEXT;",
           "ALTER TABLE operatorbundle ADD COLUMN skiprange TEXT;",
       }},
      {3,
       "replaces_skips",
       {
           "ALTER TABLE operatorbundle ADD COLUMN replaces TEXT;",
           "ALTER TABLE operatorbundle ADD COLUMN skips TEXT;",
       }},
      {4,
       "api_bundle_rows",
       {
           "CREATE TABLE IF NOT EXISTS api_provider (group_name TEXT, version TEXT, kind TEXT, operatorbundle_name TEXT, "
           "operatorbundle_version TEXT, operatorbundle_path TEXT);",
           "CREATE TABLE IF NOT EXISTS api_requirer (group_name TEXT, version TEXT, kind TEXT, operatorbundle_name TEXT, "
           "operatorbundle_version TEXT, operatorbundle_path TEXT);",
       }},
      {5,
       "properties_dependencies",
       {
           "CREATE TABLE IF NOT EXISTS properties (type TEXT, value TEXT, operatorbundle_name TEXT, operatorbundle_version TEXT, "
           "operatorbundle_path TEXT);",
           "CREATE TABLE IF NOT EXISTS dependencies (type TEXT, value TEXT, operatorbundle_name TEXT, operatorbundle_version TEXT, "
           "operatorbundle_path TEXT);",
       }},
      {6,
       "deprecated",
       {
           "CREATE TABLE IF NOT EXISTS deprecated (operatorbundle_name TEXT PRIMARY KEY);",
       }},
      {7,
       "substitutesfor",
       {
           "ALTER TABLE operatorbundle ADD COLUMN substitutesfor TEXT;",
       }},
      {8,
       "lookup_indexes",
       {
           "CREATE INDEX IF NOT EXISTS channel_entry_bundle ON channel_entry(operatorbundle_name);",
           "CREATE INDEX IF NOT EXISTS channel_entry_replaces ON channel_entry(replaces);",
           "CREATE INDEX IF NOT EXISTS properties_bundle ON properties(operatorbundle_name);",
           "CREATE INDEX IF NOT EXISTS dependencies_bundle ON dependencies(operatorbundle_name);",
       }},
  };
  return kMigrations;
}

} // namespace catalog::db::sql
