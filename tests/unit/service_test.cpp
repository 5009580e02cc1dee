#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/entity/canonical_json.hpp"
#include "internal/entity/entity_codec.hpp"
#include "internal/factory.hpp"
#include "internal/graph/relationship.hpp"
#include "internal/util/errors.hpp"

namespace {

using engram::entity::GetStringField;
using engram::entity::MakeEntity;
using engram::entity::SetStringField;
using engram::graph::EntityRef;

engram::factory::Application BuildApp() {
  return engram::factory::Build(engram::config::ConfigLoader::LoadFromString(""));
}

void PutTask(engram::factory::Application& app, const std::string& branch, const std::string& id, const std::string& status = {}) {
  auto task = MakeEntity("task", id, "main-agent");
  SetStringField(task, "title", "task " + id);
  if (!status.empty()) SetStringField(task, "status", status);
  app.store->Store(branch, task);
}

std::string Relate(engram::factory::Application& app, const std::string& branch, const std::string& id, const std::string& from,
                   const std::string& to, const std::string& type) {
  engram::graph::RelationshipSpec spec;
  spec.id                = id;
  spec.source            = {"task", from};
  spec.target            = {"task", to};
  spec.relationship_type = type;
  spec.agent             = "main-agent";
  return app.graph->CreateRelationship(branch, spec);
}

void TestValidationView() {
  auto app = BuildApp();
  PutTask(app, "main", "T1", "todo");
  PutTask(app, "main", "T2", "done");
  PutTask(app, "main", "T3");
  Relate(app, "main", "r1", "T1", "T3", "depends_on");
  app.store->Archive("main", "task", "T2", "main-agent");

  auto& view = *app.validation;
  assert(view.TaskExists("main", "T1"));
  assert(!view.TaskExists("main", "T2"));
  assert(!view.TaskExists("main", "missing"));

  assert(view.TaskStatus("main", "T1") == std::optional<std::string>("todo"));
  assert(!view.TaskStatus("main", "T2").has_value());
  assert(!view.TaskStatus("main", "T3").has_value());

  // either direction counts
  assert(view.HasRelationshipsOfTypes("main", "T1", {"depends_on"}));
  assert(view.HasRelationshipsOfTypes("main", "T3", {"blocks", "depends_on"}));
  assert(!view.HasRelationshipsOfTypes("main", "T3", {"blocks"}));

  app.graph->DeleteRelationship("main", "r1", "main-agent");
  assert(!view.HasRelationshipsOfTypes("main", "T1", {"depends_on"}));
}

void TestExportImportRestoresBranch() {
  auto app = BuildApp();
  PutTask(app, "main", "T1", "todo");
  PutTask(app, "main", "T2");
  Relate(app, "main", "r1", "T1", "T2", "depends_on");
  app.store->Update("main", "task", "T1", [](engram::v1::Entity& e) { SetStringField(e, "status", "done"); });

  auto lines = app.exports->Export({"main", {}, true, true});
  assert(lines.size() == 3);

  // relationships come last
  auto last = engram::entity::ParseJson(lines.back());
  assert(last.struct_value().fields().at("entity").struct_value().fields().at("entity_type").string_value() ==
         engram::graph::kRelationshipType);

  auto tasks_only = app.exports->Export({"main", {"task"}, false, true});
  assert(tasks_only.size() == 2);

  app.branches->CreateBranch("restore", "restorer", std::nullopt);
  auto summary = app.exports->Import("restore", "", lines);
  assert(summary.imported == 3);
  assert(summary.unchanged == 0);
  assert(summary.failures.empty());

  assert(app.store->CurrentHash("restore", "task", "T1") == app.store->CurrentHash("main", "task", "T1"));
  assert(GetStringField(app.store->Get("restore", "task", "T1"), "status") == "done");
  assert(app.graph->GetRelationship("restore", "r1").target == (EntityRef{"task", "T2"}));

  auto again = app.exports->Import("restore", "", lines);
  assert(again.imported == 0);
  assert(again.unchanged == 3);
}

void TestImportReportsBadRecords() {
  auto app = BuildApp();
  PutTask(app, "main", "T1");
  auto lines = app.exports->Export({"main", {}, true, true});
  assert(lines.size() == 1);

  auto tampered = engram::entity::ParseJson(lines[0]);
  (*tampered.mutable_struct_value()->mutable_fields())["content_hash"].set_string_value(std::string(64, '0'));

  std::vector<std::string> records{"not json", engram::entity::CanonicalJson(tampered), "{}", lines[0]};
  auto                     summary = app.exports->Import("main", "", records);

  assert(summary.unchanged == 1);
  assert(summary.imported == 0);
  assert(summary.failures.size() == 3);
  assert(summary.failures[0].line == 1);
  assert(summary.failures[1].line == 2);
  assert(summary.failures[2].line == 3);
}

void TestImportAgentOverride() {
  auto app = BuildApp();
  PutTask(app, "main", "T1");
  auto lines = app.exports->Export({"main", {}, true, true});

  app.branches->CreateBranch("copy", "copier", std::nullopt);
  auto summary = app.exports->Import("copy", "copier", lines);
  assert(summary.imported == 1);
  assert(app.store->Get("copy", "task", "T1").agent() == "copier");
}

void TestImportIntoMissingBranchFails() {
  auto app = BuildApp();
  PutTask(app, "main", "T1");
  auto lines = app.exports->Export({"main", {}, true, true});

  bool missing = false;
  try {
    app.exports->Import("nope", "", lines);
  } catch (const engram::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestImportChecksRelationships() {
  auto app = BuildApp();
  PutTask(app, "main", "T1");
  PutTask(app, "main", "T2");
  Relate(app, "main", "r1", "T1", "T2", "depends_on");

  // relationships only: their endpoints are absent on the target branch
  auto edges = app.exports->Export({"main", {"context"}, true, true});
  assert(edges.size() == 1);
  app.branches->CreateBranch("empty", "restorer", std::nullopt);
  auto summary = app.exports->Import("empty", "", edges);
  assert(summary.imported == 0);
  assert(summary.failures.size() == 1);
  assert(summary.failures[0].line == 1);
  assert(!app.store->Find("empty", engram::graph::kRelationshipType, "r1").has_value());

  // a raw relationship entity closing a cycle is refused like CreateRelationship
  engram::graph::Relationship back;
  back.id                       = "r2";
  back.agent                    = "main-agent";
  back.source                   = {"task", "T2"};
  back.target                   = {"task", "T1"};
  back.relationship_type        = "depends_on";
  back.constraints.allow_cycles = false;
  bool refused                  = false;
  try {
    app.workspace->Store(engram::graph::ToEntity(back));
  } catch (const engram::util::CyclePrevented&) {
    refused = true;
  }
  assert(refused);
  assert(!app.store->Find("main", engram::graph::kRelationshipType, "r2").has_value());
}

void TestWorkspaceFollowsActiveBranch() {
  auto  app = BuildApp();
  auto& ws  = *app.workspace;
  assert(ws.ActiveBranch() == "main");
  assert(ws.ActiveAgent() == "engram");

  auto base = MakeEntity("task", "T", "");
  SetStringField(base, "title", "shared");
  SetStringField(base, "status", "todo");
  ws.Store(base);
  assert(ws.Get("task", "T").agent() == "engram");

  ws.Fork("alice", "alice");
  assert(ws.ActiveBranch() == "alice");
  ws.Update("task", "T", [](engram::v1::Entity& e) {
    SetStringField(e, "status", "done");
    e.set_agent("alice");
  });

  auto note = MakeEntity("context", "C", "");
  SetStringField(note, "title", "notes");
  SetStringField(note, "content", "alice only");
  ws.Store(note);
  assert(ws.Get("context", "C").agent() == "alice");

  ws.Switch("main");
  assert(!ws.Find("context", "C").has_value());
  assert(GetStringField(ws.Get("task", "T"), "status") == "todo");

  ws.Fork("bob", "bob");
  ws.Update("task", "T", [](engram::v1::Entity& e) {
    SetStringField(e, "priority", "high");
    e.set_agent("bob");
  });

  auto report = ws.SyncWith({"alice"}, "intelligent_merge");
  assert(report.conflicts.empty());

  auto merged = ws.Get("task", "T");
  assert(GetStringField(merged, "status") == "done");
  assert(GetStringField(merged, "priority") == "high");
  assert(ws.Find("context", "C").has_value());
  assert(ws.History("task", "T").size() == 3);

  ws.Archive("context", "C");
  assert(ws.List("context").empty());
  assert(ws.List("context", true).size() == 1);

  bool rejected = false;
  try {
    ws.SyncWith({}, "latest_wins");
  } catch (const engram::util::InvalidInput&) {
    rejected = true;
  }
  assert(rejected);
}

void TestWorkspaceGraph() {
  auto  app = BuildApp();
  auto& ws  = *app.workspace;
  PutTask(app, "main", "a");
  PutTask(app, "main", "b");
  PutTask(app, "main", "c");

  engram::graph::RelationshipSpec ab;
  ab.id                = "ab";
  ab.source            = {"task", "a"};
  ab.target            = {"task", "b"};
  ab.relationship_type = "depends_on";
  ws.Relate(ab);
  assert(app.graph->GetRelationship("main", "ab").agent == "engram");

  auto bc   = ab;
  bc.id     = "bc";
  bc.source = {"task", "b"};
  bc.target = {"task", "c"};
  ws.Relate(bc);

  auto path = ws.FindPath({"task", "a"}, {"task", "c"}, engram::graph::Algorithm::kBfs);
  assert(path.has_value());
  assert(path->relationship_ids == (std::vector<std::string>{"ab", "bc"}));

  assert(ws.Connected({"task", "b"}).size() == 2);
  assert(ws.Relationships({"task", "b"}).size() == 2);
  assert(ws.Stats().count == 2);

  ws.Unrelate("ab");
  assert(!ws.FindPath({"task", "a"}, {"task", "c"}, engram::graph::Algorithm::kBfs).has_value());
}

} // namespace

int main() {
  TestValidationView();
  TestExportImportRestoresBranch();
  TestImportReportsBadRecords();
  TestImportAgentOverride();
  TestImportIntoMissingBranchFails();
  TestImportChecksRelationships();
  TestWorkspaceFollowsActiveBranch();
  TestWorkspaceGraph();

  std::cout << "engram_unit_service: pass\n";
  return 0;
}
