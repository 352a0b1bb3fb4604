#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/datastore/tuple_reader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using tuplestore::datastore::ObjectAndRelation;
using tuplestore::datastore::Revision;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  tuplectl --config <config.yaml> <namespace> <revision> [options]\n"
            << "\n"
            << "Options:\n"
            << "  --object <object_id>\n"
            << "  --relation <relation>\n"
            << "  --userset <namespace>:<object_id>#<relation>\n";
}

// ns:id#rel; the relation may be empty ("ns:id#").
static std::optional<ObjectAndRelation> ParseUserset(const std::string& s) {
  const auto colon = s.find(':');
  const auto hash  = s.find('#', colon == std::string::npos ? 0 : colon);
  if (colon == std::string::npos || hash == std::string::npos || colon == 0 || hash == colon + 1) {
    return std::nullopt;
  }
  return ObjectAndRelation{s.substr(0, colon), s.substr(colon + 1, hash - colon - 1), s.substr(hash + 1)};
}

static std::optional<Revision> ParseRevision(const std::string& s) {
  if (s.empty() || s[0] == '-') {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    auto        value    = std::stoull(s, &consumed);
    if (consumed != s.size()) {
      return std::nullopt;
    }
    return static_cast<Revision>(value);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

int main(int argc, char** argv) {
  if (argc < 5 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string ns          = argv[3];
  const auto        revision    = ParseRevision(argv[4]);
  if (!revision) {
    std::cerr << "invalid revision: '" << argv[4] << "'\n";
    return 1;
  }

  std::optional<std::string>       object_id;
  std::optional<std::string>       relation;
  std::optional<ObjectAndRelation> userset;

  for (int i = 5; i < argc; i += 2) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      Usage();
      return 1;
    }
    const std::string value = argv[i + 1];

    if (flag == "--object") {
      object_id = value;
    } else if (flag == "--relation") {
      relation = value;
    } else if (flag == "--userset") {
      userset = ParseUserset(value);
      if (!userset) {
        std::cerr << "invalid userset: '" << value << "'\n";
        return 1;
      }
    } else {
      Usage();
      return 1;
    }
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = tuplestore::config::ConfigLoader::LoadFromYaml(config_path);
    tuplestore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build reader and query
    // ------------------------------------------------------------
    auto app   = tuplestore::factory::Build(config);
    auto query = app.reader->QueryTuples(ns, *revision);
    if (object_id) query = query.WithObjectId(*object_id);
    if (relation) query = query.WithRelation(*relation);
    if (userset) query = query.WithUserset(*userset);

    auto iter = app.reader->Execute(query);
    while (auto tuple = iter.Next()) {
      std::cout << tuplestore::datastore::ToString(*tuple) << '\n';
    }
    iter.Close();

    tuplestore::observability::ShutdownLogging();
  } catch (const tuplestore::util::QueryError& e) {
    TUPLESTORE_LOG_ERROR("query failed", {tuplestore::observability::StringField("error", e.what())});
    tuplestore::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    TUPLESTORE_LOG_ERROR("Fatal error", {tuplestore::observability::StringField("error", e.what())});
    tuplestore::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
