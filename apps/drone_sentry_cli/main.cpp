#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "drone_sentry/alert_pipeline.hpp"
#include "drone_sentry/alert_publisher.hpp"
#include "drone_sentry/audit_log.hpp"
#include "drone_sentry/camera_feed.hpp"
#include "drone_sentry/configuration.hpp"
#include "drone_sentry/crypto_engine.hpp"
#include "drone_sentry/data_store.hpp"
#include "drone_sentry/detector.hpp"
#include "drone_sentry/digest.hpp"
#include "drone_sentry/drone_identity.hpp"
#include "drone_sentry/flight_controller.hpp"
#include "drone_sentry/id_generator.hpp"
#include "drone_sentry/logging.hpp"
#include "drone_sentry/mission_controller.hpp"
#include "drone_sentry/models.hpp"
#include "drone_sentry/operator_commands.hpp"
#include "drone_sentry/vehicle_link.hpp"
#include "drone_sentry/version.hpp"

namespace {

using namespace drone_sentry;

std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

constexpr int k_exit_ok{0};
constexpr int k_exit_failure{1};
constexpr int k_exit_preflight{2};
constexpr int k_exit_provisioning{3};
constexpr int k_exit_tampered{4};

constexpr std::size_t k_operator_secret_bytes{32};
constexpr std::chrono::milliseconds k_watch_interval{200};

/** @brief Long-lived services shared by every subcommand that needs a provisioned drone. */
struct Runtime final {
    std::shared_ptr<IdGenerator> id_generator;
    std::shared_ptr<DroneIdentity> identity;
    std::shared_ptr<CryptoEngine> crypto;
    std::shared_ptr<DataStore> store;
    std::shared_ptr<AuditLog> audit;
};

/** @brief Everything needed to fly one mission. */
struct FlightStack final {
    std::shared_ptr<FlightController> flight;
    std::shared_ptr<SyntheticCameraFeed> camera;
    std::shared_ptr<SyntheticDetector> detector;
    std::shared_ptr<JsonLinesAlertPublisher> publisher;
};

struct PatrolOptions final {
    std::string str_waypoints_file{};
    std::optional<double> optional_altitude_m{};
    std::optional<double> optional_speed_mps{};
    bool flag_loop{true};
    std::vector<std::string> list_classes{};
    std::uint64_t detect_every_n_frames{50};
    std::string str_command_inbox{};
};

int report(const Error& error) {
    get_logger()->error("{}: {}", to_string(error.kind), error.message);
    fmt::print(stderr, "error: {}\n", error.message);
    for (const auto& reason : error.reasons) {
        fmt::print(stderr, "  - {}\n", reason);
    }
    switch (error.kind) {
        case ErrorKind::PreflightFailure:
            return k_exit_preflight;
        case ErrorKind::NotProvisioned:
        case ErrorKind::AlreadyProvisioned:
            return k_exit_provisioning;
        case ErrorKind::TamperDetected:
            return k_exit_tampered;
        default:
            return k_exit_failure;
    }
}

Result<Runtime> open_runtime(const Configuration& configuration) {
    Runtime runtime{};
    runtime.id_generator = std::make_shared<IdGenerator>();

    auto identity = DroneIdentity::open(configuration.storage.identity_dir, runtime.id_generator);
    if (!identity) {
        return identity.error();
    }
    runtime.identity = std::move(identity).value();
    if (!runtime.identity->is_provisioned()) {
        return make_error(
            ErrorKind::NotProvisioned,
            fmt::format("No identity in {}; run 'provision' first", configuration.storage.identity_dir.string())
        );
    }
    runtime.crypto = std::make_shared<CryptoEngine>(runtime.identity);

    auto store = DataStore::open(configuration.storage.db_path);
    if (!store) {
        return store.error();
    }
    runtime.store = std::shared_ptr<DataStore>(std::move(store).value());
    runtime.audit = std::make_shared<AuditLog>(runtime.store, runtime.crypto, runtime.id_generator, runtime.identity->drone_id());
    return runtime;
}

Result<FlightStack> open_flight_stack(const Configuration& configuration, const Runtime& runtime, std::uint64_t detect_every) {
    auto link = open_vehicle_link(configuration.flight);
    if (!link) {
        return link.error();
    }

    FlightStack stack{};
    stack.flight = std::make_shared<FlightController>(std::move(link).value(), configuration.flight);
    if (Status connected = stack.flight->connect(); !connected) {
        // Preflight reports the missing link alongside every other failing check.
        get_logger()->error("Flight link unavailable: {}", connected.error().message);
    }
    stack.camera = std::make_shared<SyntheticCameraFeed>();

    SyntheticDetectorOptions detector_options{};
    detector_options.every_n_frames = detect_every;
    stack.detector = std::make_shared<SyntheticDetector>(detector_options);
    stack.publisher = std::make_shared<JsonLinesAlertPublisher>(configuration.storage.outbox_path, runtime.identity->drone_id());
    return stack;
}

Result<Mission> build_mission(const Runtime& runtime, const PatrolOptions& options) {
    auto waypoints = load_waypoint_file(options.str_waypoints_file);
    if (!waypoints) {
        return waypoints.error();
    }
    MissionParameters parameters{};
    if (options.optional_altitude_m) {
        parameters.altitude_m = *options.optional_altitude_m;
    }
    if (options.optional_speed_mps) {
        parameters.speed_mps = *options.optional_speed_mps;
    }
    parameters.loop = options.flag_loop;
    if (!options.list_classes.empty()) {
        parameters.detection_classes = options.list_classes;
    }
    return Mission::create(*runtime.id_generator, "cli", std::move(waypoints).value(), parameters);
}

std::shared_ptr<MissionController> build_controller(
    const Configuration& configuration,
    const Runtime& runtime,
    const FlightStack& stack,
    Mission mission
) {
    auto alerts = std::make_shared<AlertPipeline>(
        runtime.store,
        runtime.crypto,
        runtime.audit,
        stack.publisher,
        runtime.id_generator,
        mission.id,
        configuration.storage.detections_dir,
        configuration.alerts
    );
    MissionServices services{};
    services.flight = stack.flight;
    services.camera = stack.camera;
    services.detector = stack.detector;
    services.store = runtime.store;
    services.audit = runtime.audit;
    services.alerts = std::move(alerts);
    services.publisher = stack.publisher;
    return std::make_shared<MissionController>(std::move(mission), std::move(services), configuration.patrol);
}

void print_entry(const AuditEntry& entry) {
    fmt::print("{}  {:<24} {:<22} {}\n", entry.timestamp, entry.action, entry.actor, entry.canonical_details());
}

int run_provision(const Configuration& configuration, const std::string& org_id) {
    auto id_generator = std::make_shared<IdGenerator>();
    auto identity = DroneIdentity::open(configuration.storage.identity_dir, id_generator);
    if (!identity) {
        return report(identity.error());
    }
    auto provisioned = identity.value()->provision(org_id);
    if (!provisioned) {
        return report(provisioned.error());
    }
    const ProvisionResult& result = provisioned.value();

    auto runtime = open_runtime(configuration);
    if (!runtime) {
        return report(runtime.error());
    }
    if (Result<AuditEntry> entry = runtime.value().audit->log(
            "identity_provisioned",
            {{"org_id", result.org_id}, {"hardware_fingerprint", result.hardware_fingerprint}, {"operator_id", result.operator_id}}
        );
        !entry) {
        return report(entry.error());
    }

    fmt::print("Drone provisioned\n");
    fmt::print("  drone id:     {}\n", result.drone_id);
    fmt::print("  org id:       {}\n", result.org_id);
    fmt::print("  fingerprint:  {}\n", result.hardware_fingerprint);
    fmt::print("  operator id:  {}\n", result.operator_id);
    fmt::print("  secret:       {}\n", result.operator_secret);
    fmt::print("Store the operator secret now; it is not kept on the drone and will not be shown again.\n\n");
    fmt::print("{}", result.public_key_pem);
    return k_exit_ok;
}

int run_add_operator(const Configuration& configuration, const std::string& operator_id, std::string secret) {
    auto runtime = open_runtime(configuration);
    if (!runtime) {
        return report(runtime.error());
    }
    const bool generated = secret.empty();
    if (generated) {
        auto random_bytes = secure_random_bytes(k_operator_secret_bytes);
        if (!random_bytes) {
            return report(random_bytes.error());
        }
        secret = hex_encode(random_bytes.value());
    }
    if (Status added = runtime.value().identity->add_operator(operator_id, secret); !added) {
        return report(added.error());
    }
    if (Result<AuditEntry> entry = runtime.value().audit->log("operator_added", {{"operator_id", operator_id}}); !entry) {
        return report(entry.error());
    }
    fmt::print("Operator {} registered\n", operator_id);
    if (generated) {
        fmt::print("  secret: {}\n", secret);
        fmt::print("Store the operator secret now; it will not be shown again.\n");
    }
    return k_exit_ok;
}

int run_status(const Configuration& configuration) {
    auto runtime = open_runtime(configuration);
    if (!runtime) {
        return report(runtime.error());
    }
    const DroneIdentity& identity = *runtime.value().identity;
    fmt::print("drone_sentry {}\n", k_version);
    fmt::print("  drone id:    {}\n", identity.drone_id());
    fmt::print("  org id:      {}\n", identity.org_id());
    fmt::print("  fingerprint: {}\n", identity.hardware_fingerprint());

    auto missions = runtime.value().store->list_missions();
    if (!missions) {
        return report(missions.error());
    }
    fmt::print("  missions:    {}\n", missions.value().size());

    auto link = open_vehicle_link(configuration.flight);
    if (!link) {
        return report(link.error());
    }
    FlightController flight{std::move(link).value(), configuration.flight};
    if (Status connected = flight.connect(); !connected) {
        return report(connected.error());
    }
    std::this_thread::sleep_for(k_watch_interval);
    flight.update_telemetry();
    const nlohmann::json telemetry = flight.telemetry();
    fmt::print("{}\n", telemetry.dump(2));
    flight.disconnect();
    return k_exit_ok;
}

int run_preflight(const Configuration& configuration, const PatrolOptions& options) {
    auto runtime = open_runtime(configuration);
    if (!runtime) {
        return report(runtime.error());
    }
    auto mission = build_mission(runtime.value(), options);
    if (!mission) {
        return report(mission.error());
    }
    auto stack = open_flight_stack(configuration, runtime.value(), options.detect_every_n_frames);
    if (!stack) {
        return report(stack.error());
    }
    auto controller = build_controller(configuration, runtime.value(), stack.value(), std::move(mission).value());

    const std::vector<std::string> list_issues = controller->preflight_check();
    stack.value().camera->stop();
    stack.value().flight->disconnect();
    if (!list_issues.empty()) {
        fmt::print("Preflight FAILED\n");
        for (const auto& issue : list_issues) {
            fmt::print("  - {}\n", issue);
        }
        return k_exit_preflight;
    }
    fmt::print("Preflight OK\n");
    return k_exit_ok;
}

/** @brief Forward new inbox lines to @p handler until @p stop is set. */
void watch_command_inbox(
    const std::filesystem::path& inbox_path,
    OperatorCommandHandler& handler,
    const std::atomic<bool>& stop
) {
    std::streamoff offset = 0;
    while (!stop) {
        std::ifstream stream(inbox_path);
        if (stream) {
            stream.seekg(offset);
            std::string line;
            while (std::getline(stream, line)) {
                if (stream.eof()) {
                    break;  // partial line; re-read once the writer finishes it
                }
                offset = stream.tellg();
                if (line.empty()) {
                    continue;
                }
                const CommandOutcome outcome = handler.handle_text(line);
                get_logger()->info("Inbox command '{}': {}", outcome.command, outcome.reason);
            }
        }
        std::this_thread::sleep_for(k_watch_interval);
    }
}

int run_patrol(const Configuration& configuration, const PatrolOptions& options) {
    auto runtime = open_runtime(configuration);
    if (!runtime) {
        return report(runtime.error());
    }
    auto mission = build_mission(runtime.value(), options);
    if (!mission) {
        return report(mission.error());
    }
    auto stack = open_flight_stack(configuration, runtime.value(), options.detect_every_n_frames);
    if (!stack) {
        return report(stack.error());
    }
    auto controller = build_controller(configuration, runtime.value(), stack.value(), std::move(mission).value());

    OperatorCommandHandler handler{runtime.value().crypto, runtime.value().audit, configuration.commands};
    handler.attach(controller);

    std::atomic<bool> flag_stop_watchers{false};
    std::thread thread_signals([&] {
        while (!flag_stop_watchers) {
            if (should_terminate.exchange(false)) {
                get_logger()->warn("Termination signal received, aborting mission");
                if (Status aborted = controller->abort("signal"); !aborted) {
                    get_logger()->warn("Abort ignored: {}", aborted.error().message);
                }
            }
            std::this_thread::sleep_for(k_watch_interval);
        }
    });
    std::thread thread_inbox;
    if (!options.str_command_inbox.empty()) {
        thread_inbox = std::thread([&] { watch_command_inbox(options.str_command_inbox, handler, flag_stop_watchers); });
    }

    const Result<MissionStatus> outcome = controller->start();

    flag_stop_watchers = true;
    thread_signals.join();
    if (thread_inbox.joinable()) {
        thread_inbox.join();
    }
    handler.attach(nullptr);
    stack.value().flight->disconnect();

    if (!outcome) {
        return report(outcome.error());
    }
    fmt::print("Mission {} {} with {} findings\n",
               controller->mission().id,
               to_string(outcome.value()),
               controller->total_findings());
    return k_exit_ok;
}

int run_missions(const Configuration& configuration, const std::string& status_filter) {
    auto runtime = open_runtime(configuration);
    if (!runtime) {
        return report(runtime.error());
    }
    std::optional<MissionStatus> status;
    if (!status_filter.empty()) {
        status = parse_mission_status(status_filter);
        if (!status) {
            return report(make_error(ErrorKind::InvalidArgument, "Unknown mission status " + status_filter));
        }
    }
    auto missions = runtime.value().store->list_missions(status);
    if (!missions) {
        return report(missions.error());
    }
    for (const Mission& mission : missions.value()) {
        auto findings = runtime.value().store->get_finding_count(mission.id);
        fmt::print("{}  {:<10} {:<26} waypoints={} findings={}\n",
                   mission.id,
                   to_string(mission.status),
                   mission.created_at,
                   mission.waypoints.size(),
                   findings ? findings.value() : 0);
    }
    return k_exit_ok;
}

int run_findings(const Configuration& configuration, const std::string& mission_id) {
    auto runtime = open_runtime(configuration);
    if (!runtime) {
        return report(runtime.error());
    }
    auto findings = runtime.value().store->get_findings(mission_id);
    if (!findings) {
        return report(findings.error());
    }
    for (const Finding& finding : findings.value()) {
        fmt::print("{}  {}  {:<12} {:.2f}  {:.6f},{:.6f}  {}\n",
                   finding.id,
                   finding.timestamp,
                   finding.detection_class,
                   finding.confidence,
                   finding.lat,
                   finding.lon,
                   finding.image_path);
    }
    return k_exit_ok;
}

int run_audit(const Configuration& configuration, std::size_t limit) {
    auto runtime = open_runtime(configuration);
    if (!runtime) {
        return report(runtime.error());
    }
    auto entries = runtime.value().audit->get_recent(limit);
    if (!entries) {
        return report(entries.error());
    }
    for (const AuditEntry& entry : entries.value()) {
        print_entry(entry);
    }
    return k_exit_ok;
}

int run_verify_audit(const Configuration& configuration) {
    auto runtime = open_runtime(configuration);
    if (!runtime) {
        return report(runtime.error());
    }
    auto verification = runtime.value().audit->verify_chain();
    if (!verification) {
        return report(verification.error());
    }
    if (Status intact = verification.value().to_status(); !intact) {
        fmt::print("Audit chain TAMPERED: break at entry {}\n", verification.value().count);
        return report(intact.error());
    }
    fmt::print("Audit chain valid: {} entries\n", verification.value().count);
    return k_exit_ok;
}

int run_verify_finding(const Configuration& configuration, const std::string& finding_id) {
    auto runtime = open_runtime(configuration);
    if (!runtime) {
        return report(runtime.error());
    }
    auto finding = runtime.value().store->get_finding(finding_id);
    if (!finding) {
        return report(finding.error());
    }
    if (!finding.value()) {
        return report(make_error(ErrorKind::InvalidArgument, "No finding " + finding_id));
    }
    const Finding& record = *finding.value();
    if (!runtime.value().crypto->verify_signature(record.signable_payload(), record.signature)) {
        fmt::print("Finding {} signature INVALID\n", record.id);
        return k_exit_tampered;
    }
    fmt::print("Finding {} signature valid ({} {:.2f} at {:.6f},{:.6f})\n",
               record.id,
               record.detection_class,
               record.confidence,
               record.lat,
               record.lon);
    return k_exit_ok;
}

void add_patrol_options(CLI::App& command, PatrolOptions& options, bool flight_options) {
    command.add_option("--waypoints", options.str_waypoints_file, "JSON file of {lat, lon, alt?} waypoints")
        ->required()
        ->check(CLI::ExistingFile);
    command.add_option("--altitude", options.optional_altitude_m, "Default patrol altitude in metres");
    if (!flight_options) {
        return;
    }
    command.add_option("--speed", options.optional_speed_mps, "Cruise speed in m/s");
    command.add_flag("--loop,!--no-loop", options.flag_loop, "Repeat the waypoint sequence until stopped");
    command.add_option("--classes", options.list_classes, "Detection classes that raise alerts");
    command.add_option("--detect-every", options.detect_every_n_frames, "Synthetic detector period in frames (0 disables)");
    command.add_option("--command-inbox", options.str_command_inbox, "JSON-lines file polled for operator commands");
}

}  // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    CLI::App app{"drone_sentry: autonomous surveillance mission core"};
    app.require_subcommand(1);
    app.fallthrough();
    app.set_version_flag("--version", std::string{k_version});

    std::string str_identity_dir;
    std::string str_db_path;
    app.add_option("--identity-dir", str_identity_dir, "Identity directory (overrides DRONE_SENTRY_IDENTITY_DIR)");
    app.add_option("--db", str_db_path, "SQLite database path (overrides DRONE_SENTRY_DB_PATH)");

    std::string str_org_id{"default-org"};
    auto* provision = app.add_subcommand("provision", "Generate the drone identity and first operator credential");
    provision->add_option("--org-id", str_org_id, "Organisation the drone belongs to");

    std::string str_operator_id;
    std::string str_secret;
    auto* add_operator = app.add_subcommand("add-operator", "Register another operator credential");
    add_operator->add_option("--operator-id", str_operator_id, "Operator identifier")->required();
    add_operator->add_option("--secret", str_secret, "Shared secret (generated when omitted)");

    auto* status = app.add_subcommand("status", "Show identity and live telemetry");

    PatrolOptions preflight_options{};
    auto* preflight = app.add_subcommand("preflight", "Run preflight checks without flying");
    add_patrol_options(*preflight, preflight_options, false);

    PatrolOptions patrol_options{};
    auto* patrol = app.add_subcommand("patrol", "Fly a surveillance patrol");
    add_patrol_options(*patrol, patrol_options, true);

    std::string str_status_filter;
    auto* missions = app.add_subcommand("missions", "List missions, newest first");
    missions->add_option("--status", str_status_filter, "Only missions with this status");

    std::string str_mission_id;
    auto* findings = app.add_subcommand("findings", "List findings of a mission");
    findings->add_option("--mission", str_mission_id, "Mission id")->required();

    std::size_t audit_limit{20};
    auto* audit = app.add_subcommand("audit", "Show recent audit entries");
    audit->add_option("-n,--limit", audit_limit, "Number of entries");

    auto* verify_audit = app.add_subcommand("verify-audit", "Verify the audit hash chain");

    std::string str_finding_id;
    auto* verify_finding = app.add_subcommand("verify-finding", "Verify a finding's signature");
    verify_finding->add_option("--finding", str_finding_id, "Finding id")->required();

    CLI11_PARSE(app, argc, argv);

    try {
        Configuration configuration = ConfigurationLoader::load();
        if (!str_identity_dir.empty()) {
            configuration.storage.identity_dir = str_identity_dir;
        }
        if (!str_db_path.empty()) {
            configuration.storage.db_path = str_db_path;
        }

        if (provision->parsed()) {
            return run_provision(configuration, str_org_id);
        }
        if (add_operator->parsed()) {
            return run_add_operator(configuration, str_operator_id, str_secret);
        }
        if (status->parsed()) {
            return run_status(configuration);
        }
        if (preflight->parsed()) {
            return run_preflight(configuration, preflight_options);
        }
        if (patrol->parsed()) {
            return run_patrol(configuration, patrol_options);
        }
        if (missions->parsed()) {
            return run_missions(configuration, str_status_filter);
        }
        if (findings->parsed()) {
            return run_findings(configuration, str_mission_id);
        }
        if (audit->parsed()) {
            return run_audit(configuration, audit_limit);
        }
        if (verify_audit->parsed()) {
            return run_verify_audit(configuration);
        }
        if (verify_finding->parsed()) {
            return run_verify_finding(configuration, str_finding_id);
        }
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return k_exit_failure;
}
