#include "cache_error.hpp"
#include "cache_observers.hpp"
#include "cached_content.hpp"
#include "command_line_parser.hpp"
#include "content_store.hpp"
#include "event_coalescer.hpp"
#include "file_probe.hpp"
#include "inotify_watcher.hpp"
#include "log.hpp"
#include "name_filter.hpp"
#include "settings_manager.hpp"
#include "snapshot_view.hpp"
#include "test_runner_utils.hpp"
#include "watcher_binding.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <functional>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct TestContext {
  dircache::test::LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  std::string name;
  std::function<bool(TestContext&)> fn;
};

bool fail(TestContext& ctx, const std::string& message) {
  if(ctx.verbose) {
    std::cout << "    " << message << "\n";
  }
  return false;
}

bool test_name_filter_forms(TestContext& ctx) {
  auto all = NameFilter::all();
  if(!(all.kind() == NameFilter::Kind::All)) return fail(ctx, "all.kind() == NameFilter::Kind::All");
  if(!(all.keep("anything"))) return fail(ctx, "all.keep(\"anything\")");
  if(!(all.keep(".hidden"))) return fail(ctx, "all.keep(\".hidden\")");

  auto pattern = NameFilter::matching(".*json");
  if(!(pattern.kind() == NameFilter::Kind::Pattern)) return fail(ctx, "pattern.kind() == NameFilter::Kind::Pattern");
  if(!(pattern.pattern() == ".*json")) return fail(ctx, "pattern.pattern() == \".*json\"");
  if(!(pattern.keep("y.json"))) return fail(ctx, "pattern.keep(\"y.json\")");
  if(pattern.keep("1.file")) return fail(ctx, "!pattern.keep(\"1.file\")");
  if(pattern.keep("g.t")) return fail(ctx, "!pattern.keep(\"g.t\")");

  // unanchored search
  auto partial = NameFilter::matching("txt");
  if(!(partial.keep("2.txt"))) return fail(ctx, "partial.keep(\"2.txt\")");
  if(!(partial.keep("txt.bak"))) return fail(ctx, "partial.keep(\"txt.bak\")");

  auto predicate = NameFilter::excluding([](const std::string& name) {
    return name.find(".json") != std::string::npos;
  });
  if(!(predicate.kind() == NameFilter::Kind::Predicate)) return fail(ctx, "predicate.kind() == NameFilter::Kind::Predicate");
  if(predicate.keep("y.json")) return fail(ctx, "!predicate.keep(\"y.json\")");
  if(!(predicate.keep("1.file"))) return fail(ctx, "predicate.keep(\"1.file\")");
  if(!(predicate.keep("g.t"))) return fail(ctx, "predicate.keep(\"g.t\")");

  auto empty_predicate = NameFilter::excluding(nullptr);
  if(!(empty_predicate.kind() == NameFilter::Kind::All)) return fail(ctx, "empty_predicate.kind() == NameFilter::Kind::All");
  if(!(empty_predicate.keep("y.json"))) return fail(ctx, "empty_predicate.keep(\"y.json\")");
  return true;
}

bool test_name_filter_rejects_invalid_pattern(TestContext& ctx) {
  try {
    NameFilter::matching("([unclosed");
  } catch(const std::regex_error&) {
    return true;
  }
  return fail(ctx, "invalid pattern was accepted");
}

bool test_content_store_counts_key_changes(TestContext& ctx) {
  ContentStore store;
  if(!(store.mutation_count() == 0)) return fail(ctx, "store.mutation_count() == 0");
  if(!(store.put("a.txt", CachedContent(std::in_place_type<std::string>, "one")))) return fail(ctx, "store.put(\"a.txt\", CachedContent(std::in_place_type<std::string>, \"one\"))");
  if(!(store.mutation_count() == 1)) return fail(ctx, "store.mutation_count() == 1");

  // overwrite keeps the key set
  if(store.put("a.txt", CachedContent(std::in_place_type<std::string>, "two"))) return fail(ctx, "!store.put(\"a.txt\", CachedContent(std::in_place_type<std::string>, \"two\"))");
  if(!(store.mutation_count() == 1)) return fail(ctx, "store.mutation_count() == 1");
  if(!(store.replace("a.txt", CachedContent(std::in_place_type<std::string>, "three")))) return fail(ctx, "store.replace(\"a.txt\", CachedContent(std::in_place_type<std::string>, \"three\"))");
  if(!(store.mutation_count() == 1)) return fail(ctx, "store.mutation_count() == 1");
  if(store.replace("missing", CachedContent())) return fail(ctx, "!store.replace(\"missing\", CachedContent())");
  if(store.contains("missing")) return fail(ctx, "!store.contains(\"missing\")");

  auto current = store.get("a.txt");
  if(!(current && as_text(*current) && *as_text(*current) == "three")) return fail(ctx, "current && as_text(*current) && *as_text(*current) == \"three\"");

  if(store.erase("missing")) return fail(ctx, "!store.erase(\"missing\")");
  if(!(store.mutation_count() == 1)) return fail(ctx, "store.mutation_count() == 1");
  auto prior = store.erase("a.txt");
  if(!(prior && *as_text(*prior) == "three")) return fail(ctx, "prior && *as_text(*prior) == \"three\"");
  if(!(store.mutation_count() == 2)) return fail(ctx, "store.mutation_count() == 2");
  if(!(store.size() == 0)) return fail(ctx, "store.size() == 0");
  if(store.get("a.txt")) return fail(ctx, "!store.get(\"a.txt\")");
  return true;
}

bool test_json_suffix_policy(TestContext& ctx) {
  if(!(has_suffix_ci("x.json", ".json"))) return fail(ctx, "has_suffix_ci(\"x.json\", \".json\")");
  if(!(has_suffix_ci("X.JSON", ".json"))) return fail(ctx, "has_suffix_ci(\"X.JSON\", \".json\")");
  if(!(has_suffix_ci(".json", ".json"))) return fail(ctx, "has_suffix_ci(\".json\", \".json\")");
  if(has_suffix_ci("json", ".json")) return fail(ctx, "!has_suffix_ci(\"json\", \".json\")");
  if(has_suffix_ci("x.json.bak", ".json")) return fail(ctx, "!has_suffix_ci(\"x.json.bak\", \".json\")");
  if(has_suffix_ci("x.json", "")) return fail(ctx, "!has_suffix_ci(\"x.json\", \"\")");

  ContentStore store(".json", true);
  if(!(store.wants_json("data.Json"))) return fail(ctx, "store.wants_json(\"data.Json\")");
  if(store.wants_json("data.txt")) return fail(ctx, "!store.wants_json(\"data.txt\")");
  store.set_json_parsing(false);
  if(store.json_parsing()) return fail(ctx, "!store.json_parsing()");
  if(store.wants_json("data.json")) return fail(ctx, "!store.wants_json(\"data.json\")");

  ContentStore custom(".cfg", true);
  if(!(custom.wants_json("app.CFG"))) return fail(ctx, "custom.wants_json(\"app.CFG\")");
  if(custom.wants_json("app.json")) return fail(ctx, "!custom.wants_json(\"app.json\")");
  return true;
}

bool test_snapshot_reuses_list_between_mutations(TestContext& ctx) {
  ContentStore store;
  SnapshotView view;

  auto empty = view.filenames(store);
  if(!(empty && empty->empty())) return fail(ctx, "empty && empty->empty()");
  if(!(view.rebuild_count() == 0)) return fail(ctx, "view.rebuild_count() == 0");

  store.put("b", CachedContent());
  store.put("a", CachedContent());
  store.put("c", CachedContent());
  auto first = view.filenames(store);
  auto second = view.filenames(store);
  if(!(first.get() == second.get())) return fail(ctx, "first.get() == second.get()");
  if(!(view.rebuild_count() == 1)) return fail(ctx, "view.rebuild_count() == 1");
  if(!(*first == std::vector<std::string>{"a", "b", "c"})) return fail(ctx, "*first == std::vector<std::string>{\"a\", \"b\", \"c\"}");

  // content-only change
  store.replace("a", CachedContent(std::in_place_type<std::string>, "x"));
  if(!(view.filenames(store).get() == first.get())) return fail(ctx, "view.filenames(store).get() == first.get()");

  store.erase("b");
  auto third = view.filenames(store);
  if(!(third.get() != first.get())) return fail(ctx, "third.get() != first.get()");
  if(!(*third == std::vector<std::string>{"a", "c"})) return fail(ctx, "*third == std::vector<std::string>{\"a\", \"c\"}");
  if(!(view.rebuild_count() == 2)) return fail(ctx, "view.rebuild_count() == 2");
  // earlier snapshots are untouched
  if(!(first->size() == 3)) return fail(ctx, "first->size() == 3");
  return true;
}

bool test_probe_reads_regular_files(TestContext& ctx) {
  dircache::test::TempDirectory dir("probe");
  dir.write("plain.txt", "hello\nworld");
  dir.write_json("data.json", {{"a", 1}});
  dir.make_directory("sub");

  auto text = probe_and_read(make_probe_request(dir.path(), "plain.txt", false));
  if(!text.ok()) return fail(ctx, "text.ok()");
  if(!(as_text(text.content) && *as_text(text.content) == "hello\nworld")) return fail(ctx, "as_text(text.content) && *as_text(text.content) == \"hello\\nworld\"");

  auto json = probe_and_read(make_probe_request(dir.path(), "data.json", true));
  if(!json.ok()) return fail(ctx, "json.ok()");
  if(!(as_json(json.content) && (*as_json(json.content))["a"] == 1)) return fail(ctx, "as_json(json.content) && (*as_json(json.content))[\"a\"] == 1");

  auto raw = probe_and_read(make_probe_request(dir.path(), "data.json", false));
  if(!raw.ok()) return fail(ctx, "raw.ok()");
  if(!(as_text(raw.content) && *as_text(raw.content) == R"({"a":1})")) return fail(ctx, "as_text(raw.content) && *as_text(raw.content) == R\"({\"a\":1})\"");

  auto sub = probe_and_read(make_probe_request(dir.path(), "sub", false));
  if(!sub.ok()) return fail(ctx, "sub.ok()");
  if(has_content(sub.content)) return fail(ctx, "!has_content(sub.content)");

  std::error_code ec;
  if(!(probe_entry(dir.path() / "sub", ec) == EntryKind::Directory && !ec)) return fail(ctx, "probe_entry(dir.path() / \"sub\", ec) == EntryKind::Directory && !ec");
  if(!(probe_entry(dir.path() / "plain.txt", ec) == EntryKind::Regular && !ec)) return fail(ctx, "probe_entry(dir.path() / \"plain.txt\", ec) == EntryKind::Regular && !ec");
  return true;
}

bool test_probe_missing_entry_has_no_content(TestContext& ctx) {
  dircache::test::TempDirectory dir("missing");
  std::error_code ec;
  if(!(probe_entry(dir.path() / "ghost", ec) == EntryKind::Missing)) return fail(ctx, "probe_entry(dir.path() / \"ghost\", ec) == EntryKind::Missing");
  if(ec) return fail(ctx, "!ec");

  auto result = probe_and_read(make_probe_request(dir.path(), "ghost", true));
  if(!result.ok()) return fail(ctx, "result.ok()");
  if(!(result.filename == "ghost")) return fail(ctx, "result.filename == \"ghost\"");
  if(has_content(result.content)) return fail(ctx, "!has_content(result.content)");
  return true;
}

bool test_probe_reports_malformed_json(TestContext& ctx) {
  dircache::test::TempDirectory dir("malformed");
  dir.write("bad.json", "{not json");

  auto result = probe_and_read(make_probe_request(dir.path(), "bad.json", true));
  if(result.ok()) return fail(ctx, "!result.ok()");
  if(!(result.fault->filename == "bad.json")) return fail(ctx, "result.fault->filename == \"bad.json\"");
  if(!(result.fault->code == CacheErrc::json_decode_failed)) return fail(ctx, "result.fault->code == CacheErrc::json_decode_failed");
  if(result.fault->detail.empty()) return fail(ctx, "!result.fault->detail.empty()");
  if(!(result.fault->describe().find("bad.json: malformed JSON content") == 0)) return fail(ctx, "result.fault->describe().find(\"bad.json: malformed JSON content\") == 0");

  std::string error;
  if(decode_json("", error)) return fail(ctx, "!decode_json(\"\", error)");
  if(error.empty()) return fail(ctx, "!error.empty()");
  return true;
}

bool test_list_directory(TestContext& ctx) {
  dircache::test::TempDirectory dir("listing");
  dir.write("b.txt", "");
  dir.write("a.txt", "");
  dir.make_directory("c");

  std::error_code ec;
  auto names = list_directory(dir.path(), ec);
  if(ec) return fail(ctx, "!ec");
  if(!(names == std::vector<std::string>{"a.txt", "b.txt", "c"})) return fail(ctx, "names == std::vector<std::string>{\"a.txt\", \"b.txt\", \"c\"}");

  auto none = list_directory(dir.path() / "nope", ec);
  if(!ec) return fail(ctx, "ec");
  if(!none.empty()) return fail(ctx, "none.empty()");
  return true;
}

bool test_describe_content(TestContext& ctx) {
  if(!(describe_content(CachedContent()) == "<no content>")) return fail(ctx, "describe_content(CachedContent()) == \"<no content>\"");
  if(!(describe_content(CachedContent(std::in_place_type<std::string>, "a\nb")) == "a b")) return fail(ctx, "describe_content(CachedContent(std::in_place_type<std::string>, \"a\\nb\")) == \"a b\"");
  if(!(describe_content(CachedContent(std::in_place_type<nlohmann::json>, nlohmann::json{{"k", 2}})) == R"({"k":2})")) return fail(ctx, "describe_content(CachedContent(std::in_place_type<nlohmann::json>, nlohmann::json{{\"k\", 2}})) == R\"({\"k\":2})\"");
  auto longer = describe_content(CachedContent(std::in_place_type<std::string>, std::string(100, 'x')), 10);
  if(!(longer == "xxxxxxx...")) return fail(ctx, "longer == \"xxxxxxx...\"");
  if(!(content_size(CachedContent(std::in_place_type<std::string>, "abcd")) == 4)) return fail(ctx, "content_size(CachedContent(std::in_place_type<std::string>, \"abcd\")) == 4");
  if(!(content_size(CachedContent()) == 0)) return fail(ctx, "content_size(CachedContent()) == 0");
  return true;
}

bool test_error_category(TestContext& ctx) {
  std::error_code ec = CacheErrc::stopped;
  if(!(ec.category().name() == std::string("dircache"))) return fail(ctx, "ec.category().name() == std::string(\"dircache\")");
  if(!(ec.message() == "cache stopped")) return fail(ctx, "ec.message() == \"cache stopped\"");
  if(!(make_error_code(CacheErrc::already_initialized) != make_error_code(CacheErrc::stopped))) return fail(ctx, "make_error_code(CacheErrc::already_initialized) != make_error_code(CacheErrc::stopped)");
  CacheFault whole{"", make_error_code(CacheErrc::watcher_failed), ""};
  if(!(whole.describe() == "directory watcher unavailable")) return fail(ctx, "whole.describe() == \"directory watcher unavailable\"");
  return true;
}

bool test_observers_isolate_throwing_listener(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("observers");
  ctx.logs.attach(logger);
  CacheObservers observers(logger);

  std::vector<std::string> seen;
  observers.subscribe(CacheEvent::Added, [](const CacheNotification&) {
    throw std::runtime_error("listener exploded");
  });
  auto second = observers.subscribe(CacheEvent::Added, [&](const CacheNotification& n) {
    seen.push_back(n.filename);
  });
  observers.subscribe(CacheEvent::Deleted, [&](const CacheNotification& n) {
    seen.push_back("deleted " + n.filename);
  });
  if(!(observers.subscribe(CacheEvent::Added, nullptr) == 0)) return fail(ctx, "observers.subscribe(CacheEvent::Added, nullptr) == 0");
  if(!(observers.size() == 3)) return fail(ctx, "observers.size() == 3");

  CacheNotification added;
  added.event = CacheEvent::Added;
  added.filename = "a.txt";
  observers.publish(added);
  if(!(seen == std::vector<std::string>{"a.txt"})) return fail(ctx, "seen == std::vector<std::string>{\"a.txt\"}");
  if(!(ctx.logs.contains("listener exploded"))) return fail(ctx, "ctx.logs.contains(\"listener exploded\")");

  observers.unsubscribe(second);
  observers.publish(added);
  if(!(seen.size() == 1)) return fail(ctx, "seen.size() == 1");
  if(!(observers.size() == 2)) return fail(ctx, "observers.size() == 2");
  return true;
}

bool test_watcher_binding_detach_leaves_foreign_subscriptions(TestContext& ctx) {
  dircache::test::TempDirectory dir("binding");
  auto watcher = std::make_shared<dircache::test::ManualDirectoryWatcher>(dir.path());

  int foreign = 0;
  watcher->subscribe(WatchEvent::Add, [&](const std::vector<std::string>&) { ++foreign; });

  int ours = 0;
  WatcherBinding binding;
  binding.bind(watcher, false);
  auto count = [&](const std::vector<std::string>& names) { ours += static_cast<int>(names.size()); };
  binding.attach(WatcherBinding::Handlers{count, count, count});
  if(!binding.attached()) return fail(ctx, "binding.attached()");
  if(!(watcher->subscription_count() == 4)) return fail(ctx, "watcher->subscription_count() == 4");

  watcher->emit_add({"a", "b"});
  watcher->emit_delete({"c"});
  if(!(ours == 3)) return fail(ctx, "ours == 3");
  if(!(foreign == 1)) return fail(ctx, "foreign == 1");

  binding.detach();
  binding.detach();
  if(binding.attached()) return fail(ctx, "!binding.attached()");
  if(binding.bound()) return fail(ctx, "!binding.bound()");
  if(!(watcher->subscription_count() == 1)) return fail(ctx, "watcher->subscription_count() == 1");
  if(watcher->stopped()) return fail(ctx, "!watcher->stopped()");

  watcher->emit_add({"d"});
  if(!(ours == 3)) return fail(ctx, "ours == 3");
  if(!(foreign == 2)) return fail(ctx, "foreign == 2");

  WatcherBinding owner;
  owner.bind(watcher, true);
  if(!owner.owns_watcher()) return fail(ctx, "owner.owns_watcher()");
  owner.detach();
  if(!watcher->stopped()) return fail(ctx, "watcher->stopped()");
  return true;
}

bool test_event_coalescer_nets_out_each_name(TestContext& ctx) {
  using Names = std::vector<std::string>;
  EventCoalescer events;
  events.record("created", WatchEvent::Add);
  events.record("created", WatchEvent::Delete);
  events.record("edited", WatchEvent::Change);
  events.record("edited", WatchEvent::Delete);
  events.record("replaced", WatchEvent::Delete);
  events.record("replaced", WatchEvent::Add);
  events.record("written", WatchEvent::Add);
  events.record("written", WatchEvent::Change);
  events.record("plain", WatchEvent::Change);
  events.record("plain", WatchEvent::Change);

  if(!(events.collect(WatchEvent::Add) == Names{"written"})) return fail(ctx, "only 'written' is a net add");
  if(!(events.collect(WatchEvent::Change) == Names{"replaced", "plain"})) return fail(ctx, "net changes are 'replaced', 'plain'");
  if(!(events.collect(WatchEvent::Delete) == Names{"edited"})) return fail(ctx, "only 'edited' is a net delete");

  // a name that cancelled out can come back
  events.record("created", WatchEvent::Add);
  if(!(events.collect(WatchEvent::Add) == Names{"created", "written"})) return fail(ctx, "re-added name keeps its first-seen position");
  return true;
}

bool test_inotify_resync_reports_listing_and_vanished(TestContext& ctx) {
  using Names = std::vector<std::string>;
  asio::io_context io;
  dircache::test::TempDirectory dir("resync");
  dir.write("kept.txt", "kept");
  dir.write("gone.txt", "gone");

  auto logger = std::make_shared<Logger>("resync");
  ctx.logs.attach(logger);
  auto watcher = InotifyDirectoryWatcher::create(io, dir.path(), logger);
  if(auto ec = watcher->start()) return fail(ctx, "start failed: " + ec.message());
  if(!(watcher->known_files() == Names{"gone.txt", "kept.txt"})) return fail(ctx, "initial known files");

  Names added, changed, deleted;
  watcher->subscribe(WatchEvent::Add, [&](const Names& names) { added.insert(added.end(), names.begin(), names.end()); });
  watcher->subscribe(WatchEvent::Change, [&](const Names& names) { changed.insert(changed.end(), names.begin(), names.end()); });
  watcher->subscribe(WatchEvent::Delete, [&](const Names& names) { deleted.insert(deleted.end(), names.begin(), names.end()); });

  dir.remove("gone.txt");
  dir.write("new.txt", "new");
  // io is not run, so only the rescan publishes
  watcher->resync();

  if(!added.empty()) return fail(ctx, "rescan published adds");
  if(!(changed == Names{"kept.txt", "new.txt"})) return fail(ctx, "rescan reports the whole listing as changed");
  if(!(deleted == Names{"gone.txt"})) return fail(ctx, "rescan reports vanished names as deleted");
  if(!(watcher->known_files() == Names{"kept.txt", "new.txt"})) return fail(ctx, "known files follow the rescan");

  watcher->stop();
  if(!watcher->stopped()) return fail(ctx, "watcher->stopped()");
  return true;
}

bool test_settings_defaults_and_conversion(TestContext& ctx) {
  SettingsManager settings;
  if(!(settings.get<std::string>("directory") == ".")) return fail(ctx, "settings.get<std::string>(\"directory\") == \".\"");
  if(!(settings.get<bool>("json_parsing"))) return fail(ctx, "settings.get<bool>(\"json_parsing\")");
  if(!(settings.get<int>("io_threads") == 4)) return fail(ctx, "settings.get<int>(\"io_threads\") == 4");
  if(!(settings.get<std::string>("json_suffix") == ".json")) return fail(ctx, "settings.get<std::string>(\"json_suffix\") == \".json\"");

  std::string error;
  if(!(settings.set_from_string("threads", " 8 ", error))) return fail(ctx, "settings.set_from_string(\"threads\", \" 8 \", error)");
  if(!(settings.get<int>("io_threads") == 8)) return fail(ctx, "settings.get<int>(\"io_threads\") == 8");
  if(settings.set_from_string("io_threads", "8x", error)) return fail(ctx, "!settings.set_from_string(\"io_threads\", \"8x\", error)");
  if(error.empty()) return fail(ctx, "!error.empty()");
  if(!(settings.set_from_string("JSON", "off", error))) return fail(ctx, "settings.set_from_string(\"JSON\", \"off\", error)");
  if(settings.get<bool>("json_parsing")) return fail(ctx, "!settings.get<bool>(\"json_parsing\")");
  if(settings.set_from_string("json", "maybe", error)) return fail(ctx, "!settings.set_from_string(\"json\", \"maybe\", error)");
  if(settings.set_from_string("nonsense", "1", error)) return fail(ctx, "!settings.set_from_string(\"nonsense\", \"1\", error)");
  if(settings.set_from_json("filter", 12, error)) return fail(ctx, "!settings.set_from_json(\"filter\", 12, error)");

  auto persisted = settings.get_json(true);
  if(!(persisted.contains("directory"))) return fail(ctx, "persisted.contains(\"directory\")");
  if(persisted.contains("help")) return fail(ctx, "!persisted.contains(\"help\")");
  if(persisted.contains("save")) return fail(ctx, "!persisted.contains(\"save\")");
  return true;
}

bool test_settings_round_trip_through_file(TestContext& ctx) {
  dircache::test::TempDirectory dir("settings");
  auto path = dir.path() / ".config" / "dircache.json";

  SettingsManager first;
  first.set_settings_path(path);
  std::string error;
  if(!(first.set_from_string("filter", "\\.txt$", error))) return fail(ctx, "first.set_from_string(\"filter\", \"\\\\.txt$\", error)");
  if(!(first.set_from_string("verbose", "true", error))) return fail(ctx, "first.set_from_string(\"verbose\", \"true\", error)");
  if(!first.save()) return fail(ctx, "first.save()");

  SettingsManager second;
  second.set_settings_path(path);
  if(!second.load()) return fail(ctx, "second.load()");
  if(!(second.get<std::string>("filter") == "\\.txt$")) return fail(ctx, "second.get<std::string>(\"filter\") == \"\\\\.txt$\"");
  if(!(second.get<bool>("verbose"))) return fail(ctx, "second.get<bool>(\"verbose\")");

  SettingsManager missing;
  missing.set_settings_path(dir.path() / "absent.json");
  if(missing.load()) return fail(ctx, "!missing.load()");
  return true;
}

bool test_command_line_positionals_and_options(TestContext& ctx) {
  CommandLineParser parser;
  SettingsManager settings;
  std::string error;
  bool ok = parser.parse({"/tmp/watched", "json$", "--io_threads", "2", "-c", "--json", "false"},
                         settings, error);
  if(!ok) return fail(ctx, "ok");
  if(!(settings.get<std::string>("directory") == "/tmp/watched")) return fail(ctx, "settings.get<std::string>(\"directory\") == \"/tmp/watched\"");
  if(!(settings.get<std::string>("filter") == "json$")) return fail(ctx, "settings.get<std::string>(\"filter\") == \"json$\"");
  if(!(settings.get<int>("io_threads") == 2)) return fail(ctx, "settings.get<int>(\"io_threads\") == 2");
  if(!(settings.get<bool>("print_content"))) return fail(ctx, "settings.get<bool>(\"print_content\")");
  if(settings.get<bool>("json_parsing")) return fail(ctx, "!settings.get<bool>(\"json_parsing\")");

  SettingsManager help;
  if(!(parser.parse({"-h"}, help, error))) return fail(ctx, "parser.parse({\"-h\"}, help, error)");
  if(!help.help_requested()) return fail(ctx, "help.help_requested()");
  return true;
}

bool test_command_line_rejects_bad_input(TestContext& ctx) {
  CommandLineParser parser;
  std::string error;

  SettingsManager unknown;
  if(parser.parse({"--bogus", "1"}, unknown, error)) return fail(ctx, "!parser.parse({\"--bogus\", \"1\"}, unknown, error)");
  if(!(error.find("--bogus") != std::string::npos)) return fail(ctx, "error.find(\"--bogus\") != std::string::npos");

  SettingsManager missing;
  if(parser.parse({"--suffix"}, missing, error)) return fail(ctx, "!parser.parse({\"--suffix\"}, missing, error)");
  if(!(error.find("Missing value") != std::string::npos)) return fail(ctx, "error.find(\"Missing value\") != std::string::npos");

  SettingsManager extra;
  if(parser.parse({"dir", "filter", "third"}, extra, error)) return fail(ctx, "!parser.parse({\"dir\", \"filter\", \"third\"}, extra, error)");
  if(!(error.find("third") != std::string::npos)) return fail(ctx, "error.find(\"third\") != std::string::npos");

  SettingsManager bad_int;
  if(parser.parse({"-t", "many"}, bad_int, error)) return fail(ctx, "!parser.parse({\"-t\", \"many\"}, bad_int, error)");
  return true;
}

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("DIRCACHE_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("DIRCACHE_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  dircache::test::LogCapture logs;
  TestContext ctx{logs, verbose};
  std::vector<TestCase> tests = {
    {"name_filter_forms", test_name_filter_forms},
    {"name_filter_rejects_invalid_pattern", test_name_filter_rejects_invalid_pattern},
    {"content_store_counts_key_changes", test_content_store_counts_key_changes},
    {"json_suffix_policy", test_json_suffix_policy},
    {"snapshot_reuses_list_between_mutations", test_snapshot_reuses_list_between_mutations},
    {"probe_reads_regular_files", test_probe_reads_regular_files},
    {"probe_missing_entry_has_no_content", test_probe_missing_entry_has_no_content},
    {"probe_reports_malformed_json", test_probe_reports_malformed_json},
    {"list_directory", test_list_directory},
    {"describe_content", test_describe_content},
    {"error_category", test_error_category},
    {"observers_isolate_throwing_listener", test_observers_isolate_throwing_listener},
    {"watcher_binding_detach_leaves_foreign_subscriptions", test_watcher_binding_detach_leaves_foreign_subscriptions},
    {"event_coalescer_nets_out_each_name", test_event_coalescer_nets_out_each_name},
    {"inotify_resync_reports_listing_and_vanished", test_inotify_resync_reports_listing_and_vanished},
    {"settings_defaults_and_conversion", test_settings_defaults_and_conversion},
    {"settings_round_trip_through_file", test_settings_round_trip_through_file},
    {"command_line_positionals_and_options", test_command_line_positionals_and_options},
    {"command_line_rejects_bad_input", test_command_line_rejects_bad_input}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " unit tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.detach_all();
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " unit tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
