/**
 * End-to-end job lifecycle through JobCoordinator.
 *
 * The container runtime is replaced by a shell script that understands the
 * subset of the docker CLI the executor uses: "run" links each -v mount into
 * a private root and executes the mounted /data/process.py with sh, and
 * "kill NAME" kills the process recorded for that container name. Job code
 * in these tests is therefore shell, not Python.
 */

#include <gtest/gtest.h>
#include "code_filter.h"
#include "config.h"
#include "job_coordinator.h"
#include "job_registry.h"
#include "process_launcher.h"
#include "sandbox.h"
#include <signal.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <sys/stat.h>

namespace tabrun {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

const char* FAKE_RUNTIME = R"SH(#!/bin/sh
STATE="@STATE@"
cmd="$1"
shift
case "$cmd" in
    kill)
        if [ -f "$STATE/$1.pid" ]; then
            kill -9 "$(cat "$STATE/$1.pid")" 2>/dev/null
        fi
        exit 0
        ;;
    run)
        ;;
    *)
        echo "unsupported command: $cmd" >&2
        exit 125
        ;;
esac

name=""
root=""
while [ $# -gt 0 ]; do
    case "$1" in
        --name)
            name="$2"
            root="$STATE/root-$2"
            mkdir -p "$root/data"
            shift 2
            ;;
        -v)
            host="${2%%:*}"
            rest="${2#*:}"
            target="${rest%%:*}"
            ln -s "$host" "$root$target"
            shift 2
            ;;
        --*)
            shift
            ;;
        *)
            break
            ;;
    esac
done

echo $$ > "$STATE/$name.pid"
cd "$root/data" || exit 125
exec sh ./process.py
)SH";

class JobLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/tabrun_lifecycle_XXXXXX";
        char* dir = mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        base_dir = dir;

        state_dir = base_dir / "state";
        fs::create_directories(state_dir);

        std::string script = FAKE_RUNTIME;
        script.replace(script.find("@STATE@"), 7, state_dir.string());
        fs::path runtime = base_dir / "fake-runtime";
        std::ofstream(runtime) << script;
        chmod(runtime.c_str(), 0755);

        config.data_dir = (base_dir / "data").string();
        config.timeout = 20s;
        config.max_upload_bytes = 64 * 1024;
        config.sandbox.runtime = runtime.string();
        config.sandbox.kill_grace = 2s;
        config.create_directories();

        launcher = make_native_launcher();
        start_service();
    }

    void TearDown() override {
        coordinator.reset();
        executor.reset();
        std::error_code ec;
        fs::remove_all(base_dir, ec);
    }

    // (Re)build executor and coordinator from the current config
    void start_service() {
        coordinator.reset();
        executor = std::make_unique<SandboxExecutor>(registry, *launcher, config.sandbox);
        coordinator = std::make_unique<JobCoordinator>(registry, *executor, config);
    }

    std::string upload(const std::string& content, const std::string& name = "data.csv") {
        return coordinator->upload_file(name, content);
    }

    JobRecord wait_terminal(const std::string& id, std::chrono::seconds limit = 30s) {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            auto record = coordinator->get_status(id);
            if (!record) {
                ADD_FAILURE() << "job " << id << " disappeared";
                return JobRecord{};
            }
            if (is_terminal(record->status)) {
                return *record;
            }
            std::this_thread::sleep_for(20ms);
        }
        ADD_FAILURE() << "job " << id << " did not finish within " << limit.count() << "s";
        return coordinator->get_status(id).value_or(JobRecord{});
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream out;
        out << in.rdbuf();
        return out.str();
    }

    fs::path pid_file(const std::string& id) const {
        return state_dir / ("tabrun-" + id + ".pid");
    }

    fs::path base_dir;
    fs::path state_dir;
    ServiceConfig config;
    JobRegistry registry;
    std::unique_ptr<ProcessLauncher> launcher;
    std::unique_ptr<SandboxExecutor> executor;
    std::unique_ptr<JobCoordinator> coordinator;
};

const std::string SALES_CSV = "region,total\nnorth,10\nsouth,20\neast,30\n";
const std::string COPY_CODE = "cp input_file.csv output/copy.csv\necho copied\n";
const std::string COUNT_CODE =
    "n=$(($(wc -l < input_file.csv) - 1))\n"
    "printf '{\"row_count\":%d}' \"$n\" > output/result.json\n";

// ============================================================================
// Upload
// ============================================================================

TEST_F(JobLifecycleTest, UploadStoresInputAndStartsUploaded) {
    std::string id = upload(SALES_CSV);

    auto record = coordinator->get_status(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, JobStatus::UPLOADED);
    EXPECT_EQ(record->filename, "data.csv");
    ASSERT_TRUE(record->input_path.has_value());
    EXPECT_EQ(fs::path(*record->input_path).filename().string(), id + "_data.csv");
    EXPECT_EQ(read_file(*record->input_path), SALES_CSV);
}

TEST_F(JobLifecycleTest, UploadRejectsBadFiles) {
    EXPECT_THROW(upload("print(1)", "script.py"), ValidationError);
    EXPECT_THROW(upload("a,b", ""), ValidationError);
    EXPECT_THROW(upload(std::string(65 * 1024, 'x'), "big.csv"), ValidationError);
    EXPECT_EQ(registry.size(), 0u) << "rejected uploads leave no job behind";

    try {
        upload("a,b", "notes.txt");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(std::string(e.what()), "File type not allowed. Supported formats: csv, xls, xlsx");
    }
}

TEST_F(JobLifecycleTest, UploadStripsClientDirectories) {
    std::string id = upload(SALES_CSV, "C:\\Users\\ana\\Q3 Sales.xlsx");
    EXPECT_EQ(coordinator->get_status(id)->filename, "Q3 Sales.xlsx");
}

TEST_F(JobLifecycleTest, InputAttachesOnlyOnce) {
    std::string id = coordinator->create_job("manual.csv");

    EXPECT_EQ(coordinator->attach_input(id, "/tmp/first.csv"), Outcome::OK);
    EXPECT_EQ(coordinator->attach_input(id, "/tmp/second.csv"), Outcome::CONFLICT);
    EXPECT_EQ(coordinator->attach_input("no-such-job", "/tmp/x.csv"), Outcome::NOT_FOUND);
    EXPECT_EQ(coordinator->get_status(id)->input_path.value(), "/tmp/first.csv");
}

// ============================================================================
// Submission and execution
// ============================================================================

TEST_F(JobLifecycleTest, RoundTripCopiesInputToResults) {
    std::string id = upload(SALES_CSV);

    SubmitResult submit = coordinator->submit_code(id, COPY_CODE);
    ASSERT_EQ(submit.outcome, Outcome::OK) << submit.reason;

    JobRecord record = wait_terminal(id);
    EXPECT_EQ(record.status, JobStatus::COMPLETED) << record.error.value_or("");
    EXPECT_EQ(record.exit_code.value_or(-1), 0);
    EXPECT_EQ(record.stdout_text.value_or(""), "copied\n");
    EXPECT_FALSE(record.error.has_value());

    ASSERT_TRUE(record.result_dir.has_value());
    EXPECT_EQ(read_file(fs::path(*record.result_dir) / "copy.csv"), SALES_CSV);

    ASSERT_TRUE(record.runtime_command.has_value());
    EXPECT_NE(record.runtime_command->find("--name tabrun-" + id), std::string::npos);
    EXPECT_NE(record.runtime_command->find("--network=none"), std::string::npos);
}

TEST_F(JobLifecycleTest, JsonResultAndCsvFallback) {
    std::string id = upload(SALES_CSV);
    ASSERT_EQ(coordinator->submit_code(id, COUNT_CODE).outcome, Outcome::OK);
    ASSERT_EQ(wait_terminal(id).status, JobStatus::COMPLETED);

    ResultFile json = coordinator->get_result(id, "json");
    ASSERT_EQ(json.outcome, Outcome::OK) << json.reason;
    EXPECT_EQ(read_file(json.path), "{\"row_count\":3}");
    EXPECT_EQ(json.download_name, "result_" + id + ".json");
    EXPECT_EQ(json.mime_type, "application/json");
    EXPECT_EQ(json.metadata.size_bytes, 15u);
    EXPECT_EQ(json.metadata.sha256_hash.size(), 64u);

    // No CSV was written: falls back to the JSON file
    ResultFile csv = coordinator->get_result(id, "csv");
    ASSERT_EQ(csv.outcome, Outcome::OK);
    EXPECT_EQ(csv.path, json.path);
    EXPECT_EQ(csv.download_name, "result_" + id + ".json");
}

TEST_F(JobLifecycleTest, ResultFormatSelection) {
    std::string id = upload(SALES_CSV);
    std::string code =
        "cp input_file.csv output/processed_data.csv\n"
        "printf 'PK' > output/summary.xlsx\n"
        "echo '{}' > output/stats.json\n";
    ASSERT_EQ(coordinator->submit_code(id, code).outcome, Outcome::OK);
    ASSERT_EQ(wait_terminal(id).status, JobStatus::COMPLETED);

    ResultFile csv = coordinator->get_result(id, "csv");
    EXPECT_EQ(fs::path(csv.path).filename().string(), "processed_data.csv");
    EXPECT_EQ(csv.download_name, "result_" + id + ".csv");
    EXPECT_EQ(csv.mime_type, "text/csv");

    ResultFile excel = coordinator->get_result(id, "excel");
    EXPECT_EQ(fs::path(excel.path).filename().string(), "summary.xlsx");
    EXPECT_EQ(excel.download_name, "result_" + id + ".xlsx");

    ResultFile other = coordinator->get_result(id, "parquet");
    EXPECT_EQ(fs::path(other.path).filename().string(), "stats.json");
}

TEST_F(JobLifecycleTest, FallsBackToFirstFileByName) {
    std::string id = upload(SALES_CSV);
    ASSERT_EQ(coordinator->submit_code(id, "echo b > output/b.txt\necho a > output/a.log\n").outcome,
              Outcome::OK);
    ASSERT_EQ(wait_terminal(id).status, JobStatus::COMPLETED);

    ResultFile result = coordinator->get_result(id, "json");
    ASSERT_EQ(result.outcome, Outcome::OK);
    EXPECT_EQ(fs::path(result.path).filename().string(), "a.log");
    EXPECT_EQ(result.download_name, "result_" + id + "_a.log");
}

TEST_F(JobLifecycleTest, NoOutputMeansNoResults) {
    std::string id = upload(SALES_CSV);
    ASSERT_EQ(coordinator->submit_code(id, "true\n").outcome, Outcome::OK);
    ASSERT_EQ(wait_terminal(id).status, JobStatus::COMPLETED);

    ResultFile result = coordinator->get_result(id, "json");
    EXPECT_EQ(result.outcome, Outcome::NOT_FOUND);
    EXPECT_EQ(result.reason, "No results found");
}

TEST_F(JobLifecycleTest, ResultsBeforeCompletionAreNotReady) {
    std::string id = upload(SALES_CSV);

    ResultFile early = coordinator->get_result(id, "json");
    EXPECT_EQ(early.outcome, Outcome::NOT_READY);
    EXPECT_EQ(early.reason, "Results not available yet");
    EXPECT_EQ(early.job_status, JobStatus::UPLOADED);

    EXPECT_EQ(coordinator->get_result("no-such-job", "json").outcome, Outcome::NOT_FOUND);
}

TEST_F(JobLifecycleTest, NonZeroExitFails) {
    std::string id = upload(SALES_CSV);
    ASSERT_EQ(coordinator->submit_code(id, "echo partial\necho bad input >&2\nexit 4\n").outcome,
              Outcome::OK);

    JobRecord record = wait_terminal(id);
    EXPECT_EQ(record.status, JobStatus::FAILED);
    EXPECT_EQ(record.exit_code.value_or(-1), 4);
    EXPECT_EQ(record.stdout_text.value_or(""), "partial\n");
    EXPECT_EQ(record.error.value_or(""), "Exit code: 4\nStderr: bad input\n");

    EXPECT_EQ(coordinator->get_result(id, "json").outcome, Outcome::NOT_READY);
}

TEST_F(JobLifecycleTest, TimeoutKillsTheProcess) {
    config.timeout = 1s;
    start_service();

    std::string id = upload(SALES_CSV);
    auto start = std::chrono::steady_clock::now();
    ASSERT_EQ(coordinator->submit_code(id, "echo started\nsleep 30\necho finished\n").outcome,
              Outcome::OK);

    JobRecord record = wait_terminal(id);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(record.status, JobStatus::TIMEOUT);
    EXPECT_EQ(record.error.value_or(""), "Execution timed out after 1 seconds");
    EXPECT_EQ(record.stdout_text.value_or(""), "started\n") << "partial output is kept";
    EXPECT_LT(elapsed, 15s);

    ASSERT_TRUE(fs::exists(pid_file(id)));
    long pid = std::stol(read_file(pid_file(id)));
    EXPECT_NE(::kill(static_cast<pid_t>(pid), 0), 0) << "process " << pid << " still running";
}

TEST_F(JobLifecycleTest, MissingRuntimeFailsTheJob) {
    config.sandbox.runtime = (base_dir / "no-such-runtime").string();
    start_service();

    std::string id = upload(SALES_CSV);
    ASSERT_EQ(coordinator->submit_code(id, COPY_CODE).outcome, Outcome::OK);

    JobRecord record = wait_terminal(id);
    EXPECT_EQ(record.status, JobStatus::FAILED);
    EXPECT_EQ(record.error.value_or("").rfind("Exception: ", 0), 0u);
}

// ============================================================================
// Refusals
// ============================================================================

TEST_F(JobLifecycleTest, DenylistedCodeNeverLaunches) {
    for (const auto& token : CodeFilter::denylist()) {
        std::string id = upload(SALES_CSV);

        SubmitResult result = coordinator->submit_code(id, "echo hi\n# " + token + "\n");
        EXPECT_EQ(result.outcome, Outcome::REJECTED) << token;
        EXPECT_EQ(result.reason.rfind("Forbidden module or function detected: ", 0), 0u);

        auto record = coordinator->get_status(id);
        EXPECT_EQ(record->status, JobStatus::UPLOADED) << "job stays resubmittable";
        EXPECT_FALSE(record->code_path.has_value());
        EXPECT_FALSE(record->runtime_command.has_value());
        EXPECT_FALSE(fs::exists(pid_file(id))) << "runtime was invoked for " << token;
    }
    EXPECT_EQ(coordinator->in_flight(), 0u);
}

TEST_F(JobLifecycleTest, RejectedJobCanBeResubmitted) {
    std::string id = upload(SALES_CSV);
    EXPECT_EQ(coordinator->submit_code(id, "# subprocess\n").outcome, Outcome::REJECTED);

    ASSERT_EQ(coordinator->submit_code(id, COPY_CODE).outcome, Outcome::OK);
    EXPECT_EQ(wait_terminal(id).status, JobStatus::COMPLETED);
}

TEST_F(JobLifecycleTest, SecondSubmitConflictsAndChangesNothing) {
    std::string id = upload(SALES_CSV);

    ASSERT_EQ(coordinator->submit_code(id, COPY_CODE).outcome, Outcome::OK);
    SubmitResult second = coordinator->submit_code(id, "echo other > output/other.csv\n");
    EXPECT_EQ(second.outcome, Outcome::CONFLICT);

    JobRecord record = wait_terminal(id);
    EXPECT_EQ(record.status, JobStatus::COMPLETED);
    EXPECT_EQ(read_file(*record.code_path), COPY_CODE);
    EXPECT_FALSE(fs::exists(fs::path(*record.result_dir) / "other.csv"));

    EXPECT_EQ(coordinator->submit_code(id, COPY_CODE).outcome, Outcome::CONFLICT)
        << "terminal jobs cannot be rerun";
}

TEST_F(JobLifecycleTest, SubmitWithoutInputOrJob) {
    std::string id = coordinator->create_job("pending.csv");
    EXPECT_EQ(coordinator->submit_code(id, COPY_CODE).outcome, Outcome::CONFLICT);
    EXPECT_EQ(coordinator->submit_code("no-such-job", COPY_CODE).outcome, Outcome::NOT_FOUND);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(JobLifecycleTest, ConcurrentJobsStayIndependent) {
    const int jobs = 6;
    std::vector<std::string> ids;
    std::vector<std::string> inputs;

    for (int i = 0; i < jobs; ++i) {
        std::string content = "job,value\n" + std::to_string(i) + "," + std::to_string(i * i) + "\n";
        inputs.push_back(content);
        ids.push_back(upload(content));
    }

    // Odd jobs fail on purpose
    std::vector<std::thread> submitters;
    for (int i = 0; i < jobs; ++i) {
        submitters.emplace_back([&, i] {
            std::string code = (i % 2 == 0) ? COPY_CODE : "exit " + std::to_string(10 + i) + "\n";
            EXPECT_EQ(coordinator->submit_code(ids[i], code).outcome, Outcome::OK);
        });
    }
    for (auto& t : submitters) t.join();

    ASSERT_TRUE(coordinator->wait_idle(60s));
    EXPECT_EQ(coordinator->in_flight(), 0u);

    for (int i = 0; i < jobs; ++i) {
        JobRecord record = coordinator->get_status(ids[i]).value();
        if (i % 2 == 0) {
            EXPECT_EQ(record.status, JobStatus::COMPLETED) << ids[i];
            EXPECT_EQ(read_file(fs::path(*record.result_dir) / "copy.csv"), inputs[i]);
        } else {
            EXPECT_EQ(record.status, JobStatus::FAILED) << ids[i];
            EXPECT_EQ(record.exit_code.value_or(-1), 10 + i);
        }
    }
}

// ============================================================================
// Deletion
// ============================================================================

TEST_F(JobLifecycleTest, DeleteRemovesArtifactsAndEntry) {
    std::string id = upload(SALES_CSV);
    ASSERT_EQ(coordinator->submit_code(id, COPY_CODE).outcome, Outcome::OK);
    JobRecord record = wait_terminal(id);
    ASSERT_EQ(record.status, JobStatus::COMPLETED);

    EXPECT_EQ(coordinator->delete_job(id), Outcome::OK);

    EXPECT_FALSE(coordinator->get_status(id).has_value());
    EXPECT_FALSE(fs::exists(*record.input_path));
    EXPECT_FALSE(fs::exists(*record.code_path));
    EXPECT_FALSE(fs::exists(*record.result_dir));

    EXPECT_EQ(coordinator->delete_job(id), Outcome::NOT_FOUND);
}

TEST_F(JobLifecycleTest, DeleteBeforeSubmit) {
    std::string id = upload(SALES_CSV);
    std::string input = coordinator->get_status(id)->input_path.value();

    EXPECT_EQ(coordinator->delete_job(id), Outcome::OK);
    EXPECT_FALSE(fs::exists(input));
    EXPECT_EQ(coordinator->submit_code(id, COPY_CODE).outcome, Outcome::NOT_FOUND);
}

TEST_F(JobLifecycleTest, DeleteRacingSubmitLeavesNoFilesBehind) {
    for (int round = 0; round < 60; ++round) {
        std::string id = upload(SALES_CSV);

        std::thread submitter([&] { coordinator->submit_code(id, COPY_CODE); });
        std::thread deleter([&] { EXPECT_EQ(coordinator->delete_job(id), Outcome::OK); });
        submitter.join();
        deleter.join();
    }
    ASSERT_TRUE(coordinator->wait_idle(60s));

    EXPECT_EQ(registry.size(), 0u);
    for (const std::string& dir : {config.upload_dir(), config.code_dir(), config.results_dir()}) {
        EXPECT_TRUE(fs::is_empty(dir)) << dir << " holds files of a deleted job";
    }
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_F(JobLifecycleTest, NoSubmissionsAfterShutdownBegins) {
    std::string id = upload(SALES_CSV);
    coordinator->begin_shutdown();
    EXPECT_TRUE(coordinator->is_shutting_down());

    SubmitResult result = coordinator->submit_code(id, COPY_CODE);
    EXPECT_EQ(result.outcome, Outcome::CONFLICT);
    EXPECT_EQ(result.reason, "Service is shutting down");
    EXPECT_EQ(coordinator->get_status(id)->status, JobStatus::UPLOADED);
    EXPECT_EQ(coordinator->in_flight(), 0u);
    EXPECT_FALSE(fs::exists(pid_file(id)));
}

TEST_F(JobLifecycleTest, TemplateIsAvailable) {
    std::string code = JobCoordinator::get_template();
    EXPECT_NE(code.find("/data/input_file"), std::string::npos);
    EXPECT_NE(code.find("/data/output/"), std::string::npos);
    EXPECT_TRUE(CodeFilter::validate(code).ok);
}

} // namespace
} // namespace tabrun
