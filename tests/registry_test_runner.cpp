#include "test_runner_utils.hpp"

#include "child_process.hpp"
#include "command_line_parser.hpp"
#include "file_credential_provider.hpp"
#include "local_storage_service.hpp"
#include "settings_manager.hpp"
#include "task.hpp"
#include "task_registry.hpp"
#include "upload_driver.hpp"

#include <algorithm>
#include <cerrno>

#include <signal.h>
#include <unistd.h>

using namespace relay::test;

namespace {

std::shared_ptr<Task> make_task(const std::string& id, const std::filesystem::path& output = {}) {
  return std::make_shared<Task>(id,
                                "https://example.com/v/" + id,
                                "Video " + id,
                                "bestvideo+bestaudio/best",
                                MessageTarget{"chat", id},
                                output,
                                "Video.mp4");
}

void touch(const std::filesystem::path& path, const std::string& content = "x") {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

std::string read_all(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::size_t partial_files(const std::filesystem::path& dir) {
  std::size_t count = 0;
  std::error_code ec;
  for(const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if(entry.path().extension() == ".part") ++count;
  }
  return count;
}

std::string drain_fd(int fd) {
  std::string out;
  char buffer[256];
  for(;;) {
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if(n < 0 && errno == EINTR) continue;
    if(n <= 0) break;
    out.append(buffer, static_cast<std::size_t>(n));
  }
  ::close(fd);
  return out;
}

bool test_register_rejects_duplicates(TestContext&) {
  TaskRegistry registry;
  std::string error;
  RELAY_CHECK(registry.register_task(make_task("a1"), error));
  RELAY_CHECK(!registry.register_task(make_task("a1"), error));
  RELAY_CHECK(error.find("already registered") != std::string::npos);
  RELAY_CHECK(!registry.register_task(nullptr, error));
  RELAY_CHECK(registry.size() == 1);
  RELAY_CHECK(registry.contains("a1"));
  RELAY_CHECK(registry.find("a1")->display_name() == "Video a1");
  RELAY_CHECK(!registry.find("zz"));
  return true;
}

bool test_cancel_removes_entry_and_artifacts(TestContext& ctx) {
  TempWorkspace workspace("cancel");
  auto logger = std::make_shared<Logger>("registry-test");
  ctx.logs.attach(logger);
  TaskRegistry registry(std::chrono::milliseconds(100), logger);

  auto output = workspace / "Video-c1.mp4";
  touch(output.string() + ".part");
  touch(output.string() + ".ytdl");
  auto task = make_task("c1", output);
  std::string error;
  RELAY_CHECK(registry.register_task(task, error));

  CancellationToken token(std::shared_ptr<const TaskRegistry>(&registry, [](const TaskRegistry*){}), "c1");
  RELAY_CHECK(!token.cancelled());

  auto result = registry.cancel("c1");
  RELAY_CHECK(result.found);
  RELAY_CHECK(result.task == task);
  RELAY_CHECK(!result.process_terminated);
  RELAY_CHECK(result.artifacts_removed == 2);
  RELAY_CHECK(task->state() == TaskState::Cancelled);
  RELAY_CHECK(!registry.contains("c1"));
  RELAY_CHECK(token.cancelled());
  RELAY_CHECK(!std::filesystem::exists(output.string() + ".part"));
  RELAY_CHECK(!std::filesystem::exists(output.string() + ".ytdl"));

  auto again = registry.cancel("c1");
  RELAY_CHECK(!again.found);
  RELAY_CHECK(ctx.logs.wait_for_substring("Task c1 cancelled", std::chrono::milliseconds(100)));
  return true;
}

bool test_finalize_is_idempotent(TestContext&) {
  TaskRegistry registry;
  std::string error;
  RELAY_CHECK(registry.register_task(make_task("f1"), error));
  RELAY_CHECK(registry.finalize("f1") != nullptr);
  RELAY_CHECK(registry.finalize("f1") == nullptr);
  RELAY_CHECK(!registry.cancel("f1").found);
  RELAY_CHECK(registry.size() == 0);
  return true;
}

bool test_resolve_prefix(TestContext&) {
  TaskRegistry registry;
  std::string error;
  RELAY_CHECK(registry.register_task(make_task("abc123"), error));
  RELAY_CHECK(registry.register_task(make_task("abd456"), error));

  auto exact = registry.resolve("abc123", error);
  RELAY_CHECK(exact && *exact == "abc123");
  auto unique = registry.resolve("abd", error);
  RELAY_CHECK(unique && *unique == "abd456");
  RELAY_CHECK(!registry.resolve("ab", error));
  RELAY_CHECK(error.find("ambiguous") != std::string::npos);
  RELAY_CHECK(!registry.resolve("x", error));
  RELAY_CHECK(!registry.resolve("", error));

  auto tasks = registry.snapshot();
  RELAY_CHECK(tasks.size() == 2);
  RELAY_CHECK(tasks[0].id == "abc123");
  RELAY_CHECK(!tasks[0].has_process);
  return true;
}

bool test_attach_after_cancel_fails(TestContext&) {
  auto registry = std::make_shared<TaskRegistry>(std::chrono::milliseconds(100));
  std::string error;
  RELAY_CHECK(registry->register_task(make_task("r1"), error));
  RELAY_CHECK(registry->cancel("r1").found);

  auto process = ChildProcess::spawn({"sleep", "30"}, error);
  RELAY_CHECK(process != nullptr);
  RELAY_CHECK(!registry->attach_process("r1", process));
  process->terminate_tree(std::chrono::milliseconds(100));
  RELAY_CHECK(process->try_wait().has_value());
  return true;
}

bool test_cancel_terminates_attached_process(TestContext&) {
  auto registry = std::make_shared<TaskRegistry>(std::chrono::milliseconds(200));
  std::string error;
  RELAY_CHECK(registry->register_task(make_task("p1"), error));
  auto process = ChildProcess::spawn({"sh", "-c", "sleep 30 & wait"}, error);
  RELAY_CHECK(process != nullptr);
  RELAY_CHECK(registry->attach_process("p1", process));
  RELAY_CHECK(registry->snapshot().front().has_process);

  const auto started = std::chrono::steady_clock::now();
  auto result = registry->cancel("p1");
  RELAY_CHECK(result.found);
  RELAY_CHECK(result.process_terminated);
  RELAY_CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));

  auto code = process->try_wait();
  RELAY_CHECK(code.has_value());
  RELAY_CHECK(*code >= 128);
  RELAY_CHECK(!process->running());
  return true;
}

bool test_child_process_output_and_exit(TestContext&) {
  std::string error;
  auto process = ChildProcess::spawn({"sh", "-c", "printf out; printf err >&2; exit 3"}, error);
  RELAY_CHECK(process != nullptr);
  RELAY_CHECK(drain_fd(process->release_stdout()) == "out");
  RELAY_CHECK(drain_fd(process->release_stderr()) == "err");
  RELAY_CHECK(process->release_stdout() == -1);
  RELAY_CHECK(eventually([&]{ return process->try_wait().has_value(); }, std::chrono::seconds(5)));
  RELAY_CHECK(*process->try_wait() == 3);
  return true;
}

bool test_child_process_missing_program(TestContext&) {
  std::string error;
  auto process = ChildProcess::spawn({"/nonexistent/relay-retriever"}, error);
  RELAY_CHECK(process == nullptr);
  RELAY_CHECK(error.find("cannot execute '/nonexistent/relay-retriever'") != std::string::npos);
  RELAY_CHECK(!ChildProcess::spawn({}, error));
  return true;
}

bool test_credential_file_states(TestContext& ctx) {
  TempWorkspace workspace("creds");
  auto logger = std::make_shared<Logger>("credential-test");
  ctx.logs.attach(logger);
  FileCredentialProvider provider(workspace / "token.json", logger);
  provider.set_clock([]{ return static_cast<int64_t>(1000); });

  RELAY_CHECK(!provider.get_credential());
  RELAY_CHECK(ctx.logs.wait_for_substring("not found", std::chrono::milliseconds(100)));

  std::string error;
  Credential credential;
  credential.access_token = "abc";
  credential.expires_at = 2000;
  RELAY_CHECK(provider.store(credential, error));
  auto loaded = provider.get_credential();
  RELAY_CHECK(loaded && loaded->access_token == "abc" && loaded->expires_at == 2000);

  provider.set_clock([]{ return static_cast<int64_t>(5000); });
  RELAY_CHECK(!provider.get_credential());

  touch(workspace / "token.json", "{\"access_token\": \"\"}");
  RELAY_CHECK(!provider.get_credential());

  touch(workspace / "token.json", "{not json");
  RELAY_CHECK(!provider.get_credential());
  RELAY_CHECK(!std::filesystem::exists(workspace / "token.json"));
  RELAY_CHECK(ctx.logs.wait_for_substring("corrupt", std::chrono::milliseconds(100)));
  return true;
}

bool test_local_storage_chunks_and_sidecar(TestContext&) {
  TempWorkspace workspace("storage");
  auto source = workspace / "clip.mp4";
  touch(source, std::string(10000, 'v'));

  LocalStorageService storage(workspace / "remote", 4096);
  Credential credential;
  credential.access_token = "t";
  UploadMetadata metadata{"Clip.mp4", "shows", ""};
  auto session = storage.create_upload_session(credential, metadata, source);
  RELAY_CHECK(session->total_bytes() == 10000);

  auto first = session->next_chunk();
  RELAY_CHECK(!first.complete);
  RELAY_CHECK(first.bytes_done == 4096);
  RELAY_CHECK(partial_files(workspace / "remote" / "shows") == 1);
  RELAY_CHECK(!session->next_chunk().complete);
  auto last = session->next_chunk();
  RELAY_CHECK(last.complete);
  RELAY_CHECK(last.bytes_done == 10000);
  RELAY_CHECK(last.remote_id.size() == 32);
  RELAY_CHECK(last.view_link.rfind("file://", 0) == 0);

  auto stored = workspace / "remote" / "shows" / "Clip.mp4";
  RELAY_CHECK(read_all(stored) == std::string(10000, 'v'));
  RELAY_CHECK(partial_files(workspace / "remote" / "shows") == 0);
  auto sidecar = nlohmann::json::parse(read_all(stored.string() + ".json"));
  RELAY_CHECK(sidecar.at("id") == last.remote_id);
  RELAY_CHECK(sidecar.at("mime_type") == "video/mp4");
  RELAY_CHECK(sidecar.at("size") == 10000);
  return true;
}

bool test_local_storage_abandoned_session(TestContext&) {
  TempWorkspace workspace("abandon");
  auto source = workspace / "clip.bin";
  touch(source, std::string(9000, 'a'));
  LocalStorageService storage(workspace / "remote", 4096);
  Credential credential;
  credential.access_token = "t";

  {
    auto session = storage.create_upload_session(credential, {"clip.bin", "", ""}, source);
    RELAY_CHECK(!session->next_chunk().complete);
  }
  RELAY_CHECK(partial_files(workspace / "remote" / "default") == 0);
  RELAY_CHECK(!std::filesystem::exists(workspace / "remote" / "default" / "clip.bin"));

  bool rejected = false;
  try {
    storage.create_upload_session(Credential{}, {"clip.bin", "", ""}, source);
  } catch(const std::runtime_error& e) {
    rejected = std::string(e.what()).find("missing access token") != std::string::npos;
  }
  RELAY_CHECK(rejected);
  RELAY_CHECK(LocalStorageService::mime_type_for("a.MKV") == "video/x-matroska");
  return true;
}

bool test_local_storage_same_name_sessions_stay_apart(TestContext&) {
  TempWorkspace workspace("same_name");
  auto first_source = workspace / "a.mp4";
  auto second_source = workspace / "b.mp4";
  touch(first_source, std::string(300, 'A'));
  touch(second_source, std::string(300, 'B'));
  LocalStorageService storage(workspace / "remote", 100);
  Credential credential;
  credential.access_token = "t";

  auto first = storage.create_upload_session(credential, {"Show.mp4", "shows", ""}, first_source);
  auto second = storage.create_upload_session(credential, {"Show.mp4", "shows", ""}, second_source);
  ChunkStatus first_status;
  ChunkStatus second_status;
  for(int i = 0; i < 3; ++i) {
    first_status = first->next_chunk();
    second_status = second->next_chunk();
  }
  RELAY_CHECK(first_status.complete && second_status.complete);
  RELAY_CHECK(first_status.remote_id != second_status.remote_id);
  RELAY_CHECK(first_status.view_link != second_status.view_link);

  auto first_path = std::filesystem::path(first_status.view_link.substr(7));
  auto second_path = std::filesystem::path(second_status.view_link.substr(7));
  RELAY_CHECK(first_path.filename() == "Show.mp4");
  RELAY_CHECK(second_path.filename() == "Show-" + second_status.remote_id.substr(0, 8) + ".mp4");
  RELAY_CHECK(read_all(first_path) == std::string(300, 'A'));
  RELAY_CHECK(read_all(second_path) == std::string(300, 'B'));
  RELAY_CHECK(partial_files(workspace / "remote" / "shows") == 0);

  // An abandoned session leaves a live one with the same name untouched.
  auto live = storage.create_upload_session(credential, {"Show.mp4", "shows", ""}, first_source);
  RELAY_CHECK(!live->next_chunk().complete);
  {
    auto dropped = storage.create_upload_session(credential, {"Show.mp4", "shows", ""}, second_source);
    RELAY_CHECK(!dropped->next_chunk().complete);
  }
  RELAY_CHECK(partial_files(workspace / "remote" / "shows") == 1);
  RELAY_CHECK(!live->next_chunk().complete);
  auto done = live->next_chunk();
  RELAY_CHECK(done.complete);
  RELAY_CHECK(read_all(done.view_link.substr(7)) == std::string(300, 'A'));
  RELAY_CHECK(read_all(first_path) == std::string(300, 'A'));
  return true;
}

bool test_upload_driver_reports_auth_failure(TestContext&) {
  TempWorkspace workspace("upload_auth");
  auto source = workspace / "clip.mp4";
  touch(source, "data");
  auto registry = std::make_shared<TaskRegistry>();
  auto task = make_task("u1", source);
  std::string error;
  RELAY_CHECK(registry->register_task(task, error));

  auto storage = std::make_shared<MemoryStorage>();
  UploadDriver driver(UploadDriver::Options{},
                      std::make_shared<StaticCredentialProvider>(std::nullopt),
                      storage);
  CancellationToken token(registry, "u1");
  auto result = driver.run(*task, source, token, [](const ProgressSnapshot&, bool){});
  RELAY_CHECK(result.status == UploadResult::Status::Failure);
  RELAY_CHECK(result.error == TaskError::AuthFailure);
  RELAY_CHECK(storage->sessions() == 0);
  return true;
}

bool test_upload_driver_chunks_with_progress(TestContext&) {
  TempWorkspace workspace("upload_ok");
  auto source = workspace / "clip.mp4";
  touch(source, std::string(50 * 1024, 'z'));
  auto registry = std::make_shared<TaskRegistry>();
  auto task = make_task("u2", source);
  std::string error;
  RELAY_CHECK(registry->register_task(task, error));

  auto storage = std::make_shared<MemoryStorage>(16 * 1024);
  UploadDriver::Options options;
  options.container_id = "folder-1";
  UploadDriver driver(options, std::make_shared<StaticCredentialProvider>(test_credential()), storage);

  std::vector<int> percents;
  int finals = 0;
  CancellationToken token(registry, "u2");
  auto result = driver.run(*task, source, token, [&](const ProgressSnapshot& snapshot, bool final){
    percents.push_back(snapshot.percent);
    if(final) ++finals;
  });
  RELAY_CHECK(result.status == UploadResult::Status::Success);
  RELAY_CHECK(!result.remote_id.empty());
  RELAY_CHECK(finals == 1);
  RELAY_CHECK(!percents.empty() && percents.front() == 0 && percents.back() == 100);
  RELAY_CHECK(std::is_sorted(percents.begin(), percents.end()));
  RELAY_CHECK(storage->chunks() == 4);
  auto stored = storage->stored();
  RELAY_CHECK(stored.size() == 1);
  RELAY_CHECK(stored[0].metadata.container_id == "folder-1");
  RELAY_CHECK(stored[0].metadata.name == "Video.mp4");
  return true;
}

bool test_upload_driver_stops_on_cancel(TestContext&) {
  TempWorkspace workspace("upload_cancel");
  auto source = workspace / "clip.mp4";
  touch(source, std::string(64 * 1024, 'z'));
  auto registry = std::make_shared<TaskRegistry>();
  auto task = make_task("u3", source);
  std::string error;
  RELAY_CHECK(registry->register_task(task, error));

  auto storage = std::make_shared<MemoryStorage>(8 * 1024);
  UploadDriver driver(UploadDriver::Options{}, std::make_shared<StaticCredentialProvider>(test_credential()), storage);
  CancellationToken token(registry, "u3");
  auto result = driver.run(*task, source, token, [&](const ProgressSnapshot& snapshot, bool){
    if(snapshot.percent >= 25) registry->cancel("u3");
  });
  RELAY_CHECK(result.status == UploadResult::Status::Cancelled);
  RELAY_CHECK(storage->stored().empty());
  RELAY_CHECK(storage->chunks() < 8);
  return true;
}

bool test_settings_types_and_aliases(TestContext&) {
  TempWorkspace workspace("settings");
  SettingsManager settings;
  std::string error;
  RELAY_CHECK(settings.get<long long>("max_parallel_tasks") == 8);
  RELAY_CHECK(settings.resolve_key("MPT") == std::optional<std::string>("max_parallel_tasks"));
  RELAY_CHECK(settings.set_from_string("mpt", "3", error));
  RELAY_CHECK(settings.get<long long>("max_parallel_tasks") == 3);
  RELAY_CHECK(!settings.set_from_string("max_parallel_tasks", "three", error));
  RELAY_CHECK(!settings.set_from_string("nope", "1", error));
  RELAY_CHECK(!settings.set_from_string("parallel", "0", error));
  RELAY_CHECK(error.find("at least 1") != std::string::npos);
  RELAY_CHECK(settings.get<long long>("max_parallel_tasks") == 3);
  RELAY_CHECK(settings.set_from_string("verbose", "on", error));
  RELAY_CHECK(settings.get<bool>("verbose"));
  RELAY_CHECK(!settings.set_from_string("headers", "\"not an array\"", error));
  RELAY_CHECK(settings.set_from_string("headers", "[\"X-Test: 1\"]", error));
  RELAY_CHECK(settings.get<nlohmann::json>("retriever_headers").size() == 1);

  auto path = workspace / ".config" / "settings.json";
  RELAY_CHECK(settings.set_from_string("help", "true", error));
  RELAY_CHECK(settings.save_to_file(path));
  auto saved = nlohmann::json::parse(read_all(path));
  RELAY_CHECK(!saved.contains("help"));

  SettingsManager reloaded;
  RELAY_CHECK(reloaded.load_from_file(path));
  RELAY_CHECK(reloaded.get<long long>("max_parallel_tasks") == 3);
  RELAY_CHECK(reloaded.get<bool>("verbose"));
  RELAY_CHECK(!reloaded.help_requested());
  return true;
}

bool test_command_line_parser(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser("relay");
  const char* args[] = {"relay", "--mpt", "4", "-v", "--notify", "500", "folder-9"};
  RELAY_CHECK(parser.parse(7, const_cast<char**>(args), settings));
  RELAY_CHECK(settings.get<long long>("max_parallel_tasks") == 4);
  RELAY_CHECK(settings.get<long long>("notify_interval_ms") == 500);
  RELAY_CHECK(settings.get<bool>("verbose"));
  RELAY_CHECK(settings.get<std::string>("destination_container") == "folder-9");

  const char* quiet[] = {"relay", "--verbose", "false"};
  RELAY_CHECK(parser.parse(3, const_cast<char**>(quiet), settings));
  RELAY_CHECK(!settings.get<bool>("verbose"));

  set_log_passthrough(false);
  const char* missing[] = {"relay", "--grace"};
  const bool missing_ok = parser.parse(2, const_cast<char**>(missing), settings);
  const char* extra[] = {"relay", "a", "b"};
  const bool extra_ok = parser.parse(3, const_cast<char**>(extra), settings);
  set_log_passthrough(true);
  RELAY_CHECK(!missing_ok);
  RELAY_CHECK(!extra_ok);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  const std::vector<TestCase> tests = {
    {"register_rejects_duplicates", test_register_rejects_duplicates},
    {"cancel_removes_entry_and_artifacts", test_cancel_removes_entry_and_artifacts},
    {"finalize_is_idempotent", test_finalize_is_idempotent},
    {"resolve_prefix", test_resolve_prefix},
    {"attach_after_cancel_fails", test_attach_after_cancel_fails},
    {"cancel_terminates_attached_process", test_cancel_terminates_attached_process},
    {"child_process_output_and_exit", test_child_process_output_and_exit},
    {"child_process_missing_program", test_child_process_missing_program},
    {"credential_file_states", test_credential_file_states},
    {"local_storage_chunks_and_sidecar", test_local_storage_chunks_and_sidecar},
    {"local_storage_abandoned_session", test_local_storage_abandoned_session},
    {"local_storage_same_name_sessions_stay_apart", test_local_storage_same_name_sessions_stay_apart},
    {"upload_driver_reports_auth_failure", test_upload_driver_reports_auth_failure},
    {"upload_driver_chunks_with_progress", test_upload_driver_chunks_with_progress},
    {"upload_driver_stops_on_cancel", test_upload_driver_stops_on_cancel},
    {"settings_types_and_aliases", test_settings_types_and_aliases},
    {"command_line_parser", test_command_line_parser},
  };
  return run_test_cases("registry", tests, argc, argv);
}
