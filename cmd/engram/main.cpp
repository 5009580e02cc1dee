#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/entity/entity_codec.hpp"
#include "internal/factory.hpp"
#include "internal/graph/path_finder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  engram --config <config.yaml> <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  branches\n"
            << "  branch <name> <agent> [from]\n"
            << "  delete-branch <name>\n"
            << "  put <branch> <entity.json>\n"
            << "  get <branch> <type> <id>\n"
            << "  list <branch> [type]\n"
            << "  history <branch> <type> <id>\n"
            << "  archive <branch> <type> <id> <agent>\n"
            << "  relate <branch> <type:id> <type:id> <relationship_type> [agent]\n"
            << "  path <branch> <type:id> <type:id> [bfs|dfs|dijkstra]\n"
            << "  connected <branch> <type:id>\n"
            << "  stats <branch>\n"
            << "  sync <strategy> <branch> <branch>... [--dry-run]\n"
            << "  conflicts [--all]\n"
            << "  export <branch>\n"
            << "  import <branch> <file.jsonl> [agent]\n";
}

// Types never contain ':', so everything after the first one is the id.
static engram::graph::EntityRef ParseRef(const std::string& s) {
  const auto colon = s.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == s.size()) {
    throw engram::util::InvalidInput("expected <type>:<id>, got '" + s + "'");
  }
  return {s.substr(0, colon), s.substr(colon + 1)};
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw engram::util::NotFound("cannot open " + path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

static void PrintReport(const engram::sync::SyncReport& report) {
  if (report.nothing_to_synchronize) {
    std::cout << "nothing to synchronize\n";
    return;
  }
  std::cout << "strategy=" << report.strategy << " generation=" << report.generation << (report.dry_run ? " (dry run)" : "") << "\n"
            << "examined=" << report.entities_examined << " merged=" << report.entities_merged << " updated=" << report.entities_updated
            << " duration_ms=" << report.duration_ms << "\n";
  for (const auto& c : report.conflicts) {
    std::cout << "conflict " << engram::sync::ToString(c.kind) << " " << c.entity_type << "/" << c.entity_id << (c.field.empty() ? "" : " field=")
              << c.field << ": " << c.resolution << "\n";
  }
  for (const auto& key : report.escalated) std::cout << "escalated " << key << "\n";
}

static int Run(engram::factory::Application& app, const std::vector<std::string>& args) {
  using engram::graph::EntityRef;

  const auto& cmd  = args[0];
  auto        need = [&](std::size_t n) {
    if (args.size() < n + 1) throw engram::util::InvalidInput(cmd + ": expected " + std::to_string(n) + " argument(s)");
  };

  if (cmd == "branches") {
    const auto active = app.branches->Active();
    for (const auto& b : app.branches->List()) {
      std::cout << (b.name == active ? "* " : "  ") << b.name << " agent=" << b.agent << (b.parent.empty() ? "" : " from=") << b.parent << "\n";
    }
  } else if (cmd == "branch") {
    need(2);
    std::optional<std::string> from;
    if (args.size() > 3) from = args[3];
    app.branches->CreateBranch(args[1], args[2], from);
    std::cout << args[1] << "\n";
  } else if (cmd == "delete-branch") {
    need(1);
    app.branches->DeleteBranch(args[1]);
  } else if (cmd == "put") {
    need(2);
    std::cout << app.store->Store(args[1], engram::entity::DecodeEntity(ReadFile(args[2]))) << "\n";
  } else if (cmd == "get") {
    need(3);
    std::cout << engram::entity::EncodeEntity(app.store->Get(args[1], args[2], args[3])) << "\n";
  } else if (cmd == "list") {
    need(1);
    for (const auto& e : app.store->List(args[1], args.size() > 2 ? args[2] : "")) {
      std::cout << engram::entity::EncodeEntity(e) << "\n";
    }
  } else if (cmd == "history") {
    need(3);
    for (const auto& hash : app.store->History(args[1], args[2], args[3])) std::cout << hash << "\n";
  } else if (cmd == "archive") {
    need(4);
    std::cout << app.store->Archive(args[1], args[2], args[3], args[4]) << "\n";
  } else if (cmd == "relate") {
    need(4);
    engram::graph::RelationshipSpec spec;
    spec.source            = ParseRef(args[2]);
    spec.target            = ParseRef(args[3]);
    spec.relationship_type = args[4];
    spec.agent             = args.size() > 5 ? args[5] : app.branches->Get(args[1]).agent;
    std::cout << app.graph->CreateRelationship(args[1], spec) << "\n";
  } else if (cmd == "path") {
    need(3);
    const auto algorithm = engram::graph::ParseAlgorithm(args.size() > 4 ? args[4] : "bfs");
    auto       path      = app.graph->FindPath(args[1], ParseRef(args[2]), ParseRef(args[3]), algorithm);
    if (!path) {
      std::cout << "no path\n";
      return 3;
    }
    for (const auto& ref : path->entities) std::cout << ref.ToString() << "\n";
    std::cout << "cost=" << path->total_cost << "\n";
  } else if (cmd == "connected") {
    need(2);
    for (const auto& ref : app.graph->Connected(args[1], ParseRef(args[2]))) std::cout << ref.ToString() << "\n";
  } else if (cmd == "stats") {
    need(1);
    const auto stats = app.graph->Stats(args[1]);
    std::cout << "relationships=" << stats.count << " nodes=" << stats.node_count << " density=" << stats.density
              << " bidirectional=" << stats.bidirectional_count << " average_connections=" << stats.average_connections << "\n";
    for (const auto& [type, count] : stats.by_type) std::cout << "  " << type << "=" << count << "\n";
    if (stats.most_connected) {
      std::cout << "most_connected=" << stats.most_connected->ToString() << " degree=" << stats.most_connected_degree << "\n";
    }
  } else if (cmd == "sync") {
    need(2);
    engram::sync::SyncOptions options;
    std::vector<std::string>  branches;
    for (std::size_t i = 2; i < args.size(); ++i) {
      if (args[i] == "--dry-run") {
        options.dry_run = true;
      } else {
        branches.push_back(args[i]);
      }
    }
    const auto report = app.scheduler->Submit(branches, args[1], options).get();
    PrintReport(report);
    return report.HasConflicts() ? 4 : 0;
  } else if (cmd == "conflicts") {
    const bool all = args.size() > 1 && args[1] == "--all";
    for (const auto& c : app.sync->ListConflicts(!all)) {
      std::cout << c.fingerprint.substr(0, 12) << " " << engram::util::FormatUnixMillis(c.created_at_ms) << " " << c.kind << " " << c.entity_type
                << "/" << c.entity_id
                << (c.field.empty() ? "" : " field=") << c.field << (c.resolved ? " resolved" : "") << "\n";
    }
  } else if (cmd == "export") {
    need(1);
    engram::service::ExportService::ExportRequest req;
    req.branch = args[1];
    for (const auto& line : app.exports->Export(req)) std::cout << line << "\n";
  } else if (cmd == "import") {
    need(2);
    std::vector<std::string> records;
    std::istringstream       in(ReadFile(args[2]));
    for (std::string line; std::getline(in, line);) {
      if (!line.empty()) records.push_back(line);
    }
    const auto summary = app.exports->Import(args[1], args.size() > 3 ? args[3] : "", records);
    std::cout << "imported=" << summary.imported << " unchanged=" << summary.unchanged << " failed=" << summary.failures.size() << "\n";
    for (const auto& f : summary.failures) std::cerr << "line " << f.line << ": " << f.error << "\n";
    return summary.failures.empty() ? 0 : 1;
  } else {
    Usage();
    return 1;
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }
  const std::string              config_path = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = engram::config::ConfigLoader::LoadFromYaml(config_path);

    engram::observability::InitializeTracing(config);
    engram::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = engram::factory::Build(config);

    const int rc = Run(app, args);

    app.sync_worker->Stop();
    engram::observability::ShutdownLogging();
    engram::observability::ShutdownTracing();
    return rc;
  } catch (const std::exception& e) {
    ENGRAM_LOG_ERROR("Fatal error", {engram::observability::StringField("error", e.what())});
    std::cerr << "error: " << e.what() << "\n";
    engram::observability::ShutdownLogging();
    engram::observability::ShutdownTracing();
    return 2;
  }
}
