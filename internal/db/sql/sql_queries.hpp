#pragma once

namespace catalog::db::sql {

/*
  Canonical SQL of the registry store.

  Shared by the loader (writes) and the querier (reads).
*/

// ------------------------------------------------------------------
// Bundles
// ------------------------------------------------------------------

static constexpr const char* INSERT_BUNDLE =
    "INSERT INTO operatorbundle(name, csv, bundle, bundlepath, version, skiprange, replaces, skips, substitutesfor)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_BUNDLE_GRAPH_FIELDS =
    "SELECT name, version, bundlepath, replaces, skips, substitutesfor FROM operatorbundle WHERE name=?;";

static constexpr const char* SELECT_BUNDLE_BY_PATH =
    "SELECT name, version FROM operatorbundle WHERE bundlepath=? LIMIT 1;";

static constexpr const char* UPDATE_BUNDLE_REPLACES_FROM =
    "UPDATE operatorbundle SET replaces=? WHERE replaces=? AND name<>?;";

static constexpr const char* UPDATE_BUNDLE_SKIPS =
    "UPDATE operatorbundle SET skips=? WHERE name=?;";

static constexpr const char* SELECT_SUBSTITUTIONS_FOR =
    "SELECT name FROM operatorbundle WHERE substitutesfor=? ORDER BY name;";

static constexpr const char* CLEAR_NON_HEAD_MANIFESTS =
    "UPDATE operatorbundle SET csv=NULL, bundle=NULL"
    " WHERE name NOT IN (SELECT head_operatorbundle_name FROM channel WHERE head_operatorbundle_name IS NOT NULL)"
    " AND bundlepath IS NOT NULL AND bundlepath<>'';";

static constexpr const char* INSERT_RELATED_IMAGE =
    "INSERT INTO related_image(image, operatorbundle_name) VALUES(?,?);";

static constexpr const char* SELECT_PROPERTY_EXISTS =
    "SELECT 1 FROM properties WHERE type=? AND value=? AND operatorbundle_name=? LIMIT 1;";

static constexpr const char* INSERT_PROPERTY =
    "INSERT INTO properties(type, value, operatorbundle_name, operatorbundle_version, operatorbundle_path) VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_DEPENDENCY_EXISTS =
    "SELECT 1 FROM dependencies WHERE type=? AND value=? AND operatorbundle_name=? LIMIT 1;";

static constexpr const char* INSERT_DEPENDENCY =
    "INSERT INTO dependencies(type, value, operatorbundle_name, operatorbundle_version, operatorbundle_path) VALUES(?,?,?,?,?);";

static constexpr const char* INSERT_API =
    "INSERT OR IGNORE INTO api(group_name, version, kind, plural) VALUES(?,?,?,?);";

static constexpr const char* INSERT_API_PROVIDER =
    "INSERT INTO api_provider(group_name, version, kind, operatorbundle_name, operatorbundle_version, operatorbundle_path)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* INSERT_API_REQUIRER =
    "INSERT INTO api_requirer(group_name, version, kind, operatorbundle_name, operatorbundle_version, operatorbundle_path)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* DELETE_BUNDLE            = "DELETE FROM operatorbundle WHERE name=?;";
static constexpr const char* DELETE_BUNDLE_IMAGES     = "DELETE FROM related_image WHERE operatorbundle_name=?;";
static constexpr const char* DELETE_BUNDLE_PROPERTIES = "DELETE FROM properties WHERE operatorbundle_name=?;";
static constexpr const char* DELETE_BUNDLE_DEPS       = "DELETE FROM dependencies WHERE operatorbundle_name=?;";
static constexpr const char* DELETE_BUNDLE_PROVIDED   = "DELETE FROM api_provider WHERE operatorbundle_name=?;";
static constexpr const char* DELETE_BUNDLE_REQUIRED   = "DELETE FROM api_requirer WHERE operatorbundle_name=?;";

static constexpr const char* SELECT_STRANDED_BUNDLES =
    "SELECT name FROM operatorbundle"
    " WHERE name NOT IN (SELECT operatorbundle_name FROM channel_entry WHERE operatorbundle_name IS NOT NULL)"
    " AND name NOT IN (SELECT operatorbundle_name FROM deprecated)"
    " ORDER BY name;";

// ------------------------------------------------------------------
// Deprecation
// ------------------------------------------------------------------

static constexpr const char* SELECT_IS_DEPRECATED =
    "SELECT 1 FROM deprecated WHERE operatorbundle_name=? LIMIT 1;";

static constexpr const char* INSERT_DEPRECATED =
    "INSERT OR REPLACE INTO deprecated(operatorbundle_name) VALUES(?);";

static constexpr const char* SELECT_DEFAULT_CHANNEL_HEADED_BY =
    "SELECT p.name, c.name FROM package p"
    " JOIN channel c ON c.package_name=p.name AND c.name=p.default_channel"
    " WHERE c.head_operatorbundle_name=?;";

static constexpr const char* DELETE_CHANNELS_HEADED_BY =
    "DELETE FROM channel WHERE head_operatorbundle_name=?;";

// ------------------------------------------------------------------
// Packages and channels
// ------------------------------------------------------------------

static constexpr const char* INSERT_PACKAGE            = "INSERT INTO package(name) VALUES(?);";
static constexpr const char* UPDATE_DEFAULT_CHANNEL    = "UPDATE package SET default_channel=? WHERE name=?;";
static constexpr const char* DELETE_PACKAGE            = "DELETE FROM package WHERE name=?;";
static constexpr const char* DELETE_PACKAGE_CHANNELS   = "DELETE FROM channel WHERE package_name=?;";
static constexpr const char* DELETE_PACKAGE_ENTRIES    = "DELETE FROM channel_entry WHERE package_name=?;";
static constexpr const char* SELECT_PACKAGE_EXISTS     = "SELECT 1 FROM package WHERE name=? LIMIT 1;";

static constexpr const char* INSERT_CHANNEL =
    "INSERT INTO channel(name, package_name, head_operatorbundle_name) VALUES(?,?,?);";

static constexpr const char* SELECT_PACKAGE_BUNDLE_NAMES =
    "SELECT DISTINCT operatorbundle_name FROM channel_entry WHERE package_name=? ORDER BY operatorbundle_name;";

static constexpr const char* SELECT_PACKAGE_CHANNEL_HEADS =
    "SELECT name, head_operatorbundle_name FROM channel WHERE package_name=? ORDER BY name;";

// ------------------------------------------------------------------
// Channel entries
// ------------------------------------------------------------------

static constexpr const char* INSERT_CHANNEL_ENTRY =
    "INSERT INTO channel_entry(channel_name, package_name, operatorbundle_name, depth) VALUES(?,?,?,?);";

static constexpr const char* UPDATE_ENTRY_REPLACES =
    "UPDATE channel_entry SET replaces=? WHERE entry_id=?;";

static constexpr const char* SELECT_BUNDLE_MEMBERSHIP =
    "SELECT DISTINCT package_name, channel_name FROM channel_entry WHERE operatorbundle_name=? ORDER BY package_name, channel_name;";

static constexpr const char* SELECT_BUNDLE_REPLACERS =
    "SELECT DISTINCT e.operatorbundle_name FROM channel_entry e"
    " JOIN channel_entry r ON e.replaces=r.entry_id"
    " WHERE r.operatorbundle_name=? ORDER BY e.operatorbundle_name;";

static constexpr const char* NULL_REPLACES_INTO_BUNDLE =
    "UPDATE channel_entry SET replaces=NULL"
    " WHERE replaces IN (SELECT entry_id FROM channel_entry WHERE operatorbundle_name=?);";

static constexpr const char* NULL_REPLACES_INTO_BUNDLE_IN_CHANNEL =
    "UPDATE channel_entry SET replaces=NULL"
    " WHERE replaces IN (SELECT entry_id FROM channel_entry WHERE operatorbundle_name=? AND package_name=? AND channel_name=?);";

static constexpr const char* NULL_REPLACES_OF_BUNDLE =
    "UPDATE channel_entry SET replaces=NULL WHERE operatorbundle_name=?;";

static constexpr const char* DELETE_BUNDLE_ENTRIES =
    "DELETE FROM channel_entry WHERE operatorbundle_name=?;";

static constexpr const char* DELETE_BUNDLE_ENTRIES_IN_CHANNEL =
    "DELETE FROM channel_entry WHERE operatorbundle_name=? AND package_name=? AND channel_name=?;";

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

static constexpr const char* SELECT_PACKAGE_NAMES = "SELECT name FROM package ORDER BY name;";

static constexpr const char* SELECT_DEFAULT_CHANNEL = "SELECT default_channel FROM package WHERE name=?;";

static constexpr const char* SELECT_ALL_CHANNELS =
    "SELECT package_name, name, head_operatorbundle_name FROM channel ORDER BY package_name, name;";

static constexpr const char* SELECT_BUNDLE_IN_CHANNEL =
    "SELECT ob.name, ob.csv, ob.bundle, ob.bundlepath, ob.version, ob.skiprange FROM operatorbundle ob"
    " WHERE ob.name=? AND EXISTS (SELECT 1 FROM channel_entry ce"
    " WHERE ce.operatorbundle_name=ob.name AND ce.package_name=? AND ce.channel_name=?);";

static constexpr const char* SELECT_CHANNEL_HEAD_BUNDLE =
    "SELECT ob.name, ob.csv, ob.bundle, ob.bundlepath, ob.version, ob.skiprange FROM channel c"
    " JOIN operatorbundle ob ON ob.name=c.head_operatorbundle_name"
    " WHERE c.package_name=? AND c.name=?;";

static constexpr const char* SELECT_ENTRIES_THAT_REPLACE =
    "SELECT DISTINCT e.package_name, e.channel_name, e.operatorbundle_name FROM channel_entry e"
    " JOIN channel_entry r ON e.replaces=r.entry_id"
    " WHERE r.operatorbundle_name=? ORDER BY e.package_name, e.channel_name, e.operatorbundle_name;";

static constexpr const char* SELECT_BUNDLE_THAT_REPLACES =
    "SELECT ob.name, ob.csv, ob.bundle, ob.bundlepath, ob.version, ob.skiprange FROM channel_entry e"
    " JOIN channel_entry r ON e.replaces=r.entry_id"
    " JOIN operatorbundle ob ON ob.name=e.operatorbundle_name"
    " WHERE r.operatorbundle_name=? AND e.package_name=? AND e.channel_name=?"
    " ORDER BY ob.name LIMIT 1;";

static constexpr const char* SELECT_ENTRIES_THAT_PROVIDE =
    "SELECT DISTINCT ce.package_name, ce.channel_name, ce.operatorbundle_name, r.operatorbundle_name FROM api_provider ap"
    " JOIN channel_entry ce ON ce.operatorbundle_name=ap.operatorbundle_name"
    " LEFT JOIN channel_entry r ON ce.replaces=r.entry_id"
    " WHERE ap.group_name=? AND ap.version=? AND ap.kind=?"
    " ORDER BY ce.package_name, ce.channel_name, ce.operatorbundle_name, r.operatorbundle_name;";

static constexpr const char* SELECT_PROVIDING_CHANNEL_HEADS =
    "SELECT DISTINCT c.package_name, c.name, c.head_operatorbundle_name FROM channel c"
    " JOIN api_provider ap ON ap.operatorbundle_name=c.head_operatorbundle_name"
    " WHERE ap.group_name=? AND ap.version=? AND ap.kind=?"
    " ORDER BY c.package_name, c.name;";

static constexpr const char* SELECT_HEAD_ENTRY_EDGES =
    "SELECT ce.depth, r.operatorbundle_name, EXISTS (SELECT 1 FROM operatorbundle ob WHERE ob.name=r.operatorbundle_name)"
    " FROM channel_entry ce LEFT JOIN channel_entry r ON ce.replaces=r.entry_id"
    " WHERE ce.package_name=? AND ce.channel_name=? AND ce.operatorbundle_name=?"
    " ORDER BY ce.depth, ce.entry_id;";

static constexpr const char* SELECT_LISTED_BUNDLES =
    "SELECT DISTINCT ce.package_name, ce.channel_name, ob.name, ob.csv, ob.bundle, ob.bundlepath, ob.version, ob.skiprange,"
    " ob.replaces, ob.skips FROM channel_entry ce"
    " JOIN operatorbundle ob ON ob.name=ce.operatorbundle_name"
    " ORDER BY ce.package_name, ce.channel_name, ob.name;";

static constexpr const char* SELECT_PROVIDED_APIS =
    "SELECT DISTINCT ap.group_name, ap.version, ap.kind, IFNULL(a.plural, '') FROM api_provider ap"
    " LEFT JOIN api a ON a.group_name=ap.group_name AND a.version=ap.version AND a.kind=ap.kind"
    " WHERE ap.operatorbundle_name=? ORDER BY ap.group_name, ap.version, ap.kind;";

static constexpr const char* SELECT_REQUIRED_APIS =
    "SELECT DISTINCT ar.group_name, ar.version, ar.kind, IFNULL(a.plural, '') FROM api_requirer ar"
    " LEFT JOIN api a ON a.group_name=ar.group_name AND a.version=ar.version AND a.kind=ar.kind"
    " WHERE ar.operatorbundle_name=? ORDER BY ar.group_name, ar.version, ar.kind;";

static constexpr const char* SELECT_BUNDLE_PROPERTIES =
    "SELECT type, value FROM properties WHERE operatorbundle_name=?"
    " GROUP BY type, value ORDER BY MIN(rowid);";

static constexpr const char* SELECT_BUNDLE_DEPENDENCIES =
    "SELECT type, value FROM dependencies WHERE operatorbundle_name=?"
    " GROUP BY type, value ORDER BY MIN(rowid);";

static constexpr const char* SELECT_CHANNEL_HEAD_NAME =
    "SELECT head_operatorbundle_name FROM channel WHERE package_name=? AND name=?;";

static constexpr const char* SELECT_PACKAGE_BUNDLE_PATHS =
    "SELECT DISTINCT ob.bundlepath FROM operatorbundle ob"
    " JOIN channel_entry ce ON ce.operatorbundle_name=ob.name"
    " WHERE ce.package_name=? AND ob.bundlepath IS NOT NULL AND ob.bundlepath<>'' ORDER BY ob.bundlepath;";

static constexpr const char* SELECT_ALL_IMAGES =
    "SELECT DISTINCT image FROM related_image"
    " UNION SELECT DISTINCT bundlepath FROM operatorbundle WHERE bundlepath IS NOT NULL AND bundlepath<>''"
    " ORDER BY 1;";

static constexpr const char* SELECT_BUNDLE_IMAGES =
    "SELECT DISTINCT image FROM related_image WHERE operatorbundle_name=?"
    " UNION SELECT bundlepath FROM operatorbundle WHERE name=? AND bundlepath IS NOT NULL AND bundlepath<>''"
    " ORDER BY 1;";

static constexpr const char* SELECT_ENTRY_BUNDLE = "SELECT operatorbundle_name FROM channel_entry WHERE entry_id=?;";

static constexpr const char* SELECT_PACKAGE_ENTRIES_ANNOTATED =
    "SELECT ce.package_name, ce.channel_name, ce.operatorbundle_name, IFNULL(ob.bundlepath, ''), IFNULL(ob.version, ''),"
    " IFNULL(r.operatorbundle_name, ''), IFNULL(rob.version, ''), IFNULL(rob.bundlepath, '')"
    " FROM channel_entry ce"
    " LEFT JOIN operatorbundle ob ON ob.name=ce.operatorbundle_name"
    " LEFT JOIN channel_entry r ON ce.replaces=r.entry_id"
    " LEFT JOIN operatorbundle rob ON rob.name=r.operatorbundle_name"
    " WHERE ce.package_name=? ORDER BY ce.channel_name, ce.depth, ce.entry_id;";

static constexpr const char* SELECT_PACKAGE_BUNDLE_KEYS =
    "SELECT DISTINCT IFNULL(ob.bundlepath, ''), IFNULL(ob.version, ''), ob.name FROM operatorbundle ob"
    " JOIN channel_entry ce ON ce.operatorbundle_name=ob.name"
    " WHERE ce.package_name=?;";

} // namespace catalog::db::sql
