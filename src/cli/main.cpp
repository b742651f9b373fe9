#include <array>
#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <termios.h>
#include <unistd.h>

#include "tg/boundary/command_spec.h"
#include "tg/boundary/path_guard.h"
#include "tg/config.h"
#include "tg/diagnostics/event_bus.h"
#include "tg/fault.h"
#include "tg/outcome.h"
#include "tg/security/secret_cell.h"
#include "tg/security/zeroizer.h"

namespace {

  constexpr std::size_t kMaxSecretLen = 4096;

  // sysexits.h values
  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitValidation = 65;
  constexpr int kExitSpawn = 69;
  constexpr int kExitNonZero = 70;
  constexpr int kExitOsError = 71;
  constexpr int kExitConfig = 78;

  void PrintUsage() {
    std::cerr << "TrustGate boundary checks\n";
    std::cerr << "Usage:\n";
    std::cerr << "  tg-check path     <root> <candidate>\n";
    std::cerr << "  tg-check path-new <root> <candidate>\n";
    std::cerr << "  tg-check run [--fail-on-nonzero] [--cwd DIR] [--] <program> [args...]\n";
    std::cerr << "  tg-check secret   (reads one line from stdin)\n";
    std::cerr << "\nEnvironment:\n";
    std::cerr << "  TG_WIPE_PATTERN TG_MEMLOCK TG_NO_CORE_DUMP TG_MAX_CAPTURE_BYTES\n";
    std::cerr << "  TG_FAIL_ON_NONZERO TG_LOG_LEVEL TG_AUDIT_SUBJECT_MAX\n";
  }

  int ExitCodeFor(const tg::Fault& fault) {
    switch (fault.kind) {
      case tg::FaultKind::kInvalidRoot:
      case tg::FaultKind::kPathTraversal:
      case tg::FaultKind::kNotFound:
        return kExitValidation;
      case tg::FaultKind::kSpawnFailed:
        return kExitSpawn;
      case tg::FaultKind::kNonZeroExit:
        return kExitNonZero;
      case tg::FaultKind::kInvalidConfig:
        return kExitConfig;
      case tg::FaultKind::kMemoryLockFailed:
        return kExitOsError;
    }
    return kExitOsError;
  }

  int ReportFault(tg::diagnostics::EventBus& bus, const tg::Fault& fault,
                  std::string_view operation) {
    bus.Publish(tg::diagnostics::FaultEvent(fault, operation));
    std::cerr << "error: " << fault << std::endl;
    for (const auto& entry : fault.context) {
      std::cerr << "  while: " << entry << std::endl;
    }
    return ExitCodeFor(fault);
  }

  int HandlePath(tg::diagnostics::EventBus& bus, const tg::ToolkitConfig& config,
                 const std::filesystem::path& root, std::string_view candidate, bool for_create) {
    auto validated = tg::boundary::PathGuard::Create(root, tg::PathGuardOptionsFrom(config))
                         .AndThen([&](tg::boundary::PathGuard guard) {
                           return for_create ? guard.ValidateForCreate(candidate)
                                             : guard.Validate(candidate);
                         });
    return std::move(validated).Match(
        [](tg::boundary::ValidatedPath path) {
          std::cout << path.Utf8() << std::endl;
          return kExitOk;
        },
        [&](tg::Fault fault) {
          return ReportFault(bus, fault, for_create ? "path.validate_for_create" : "path.validate");
        });
  }

  int HandleRun(tg::diagnostics::EventBus& bus, const tg::ToolkitConfig& config, int argc,
                char** argv, int index) {
    bool fail_on_nonzero = config.fail_on_nonzero_exit;
    std::optional<std::filesystem::path> cwd;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg == "--") {
        ++index;
        break;
      }
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg == "--fail-on-nonzero") {
        fail_on_nonzero = true;
        continue;
      }
      if (arg == "--cwd") {
        if (index + 1 >= argc) {
          PrintUsage();
          return kExitUsage;
        }
        cwd = std::filesystem::path(argv[++index]);
        continue;
      }
      PrintUsage();
      return kExitUsage;
    }
    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }

    auto spec = tg::CommandFrom(config, argv[index]);
    spec.FailOnNonZeroExit(fail_on_nonzero);
    if (cwd) {
      spec.WorkingDirectory(*cwd);
    }
    for (int i = index + 1; i < argc; ++i) {
      spec.Arg(argv[i]);
    }

    return spec.Run().Match(
        [&](tg::boundary::ProcessResult result) {
          std::cout << result.std_out << std::flush;
          std::cerr << result.std_err;
          if (result.std_out_truncated || result.std_err_truncated) {
            std::cerr << "[output truncated at " << config.max_capture_bytes << " bytes]\n";
          }
          std::cerr << "exit code: " << result.exit_code << std::endl;

          tg::diagnostics::Event event;
          event.category = tg::diagnostics::EventCategory::kLifecycle;
          event.severity = tg::diagnostics::EventSeverity::kDebug;
          event.event_id = "command_completed";
          event.message = "Command finished";
          event.fields.emplace_back("command", spec.Describe());
          event.fields.emplace_back("exit_code", std::to_string(result.exit_code),
                                    tg::diagnostics::FieldPrivacy::kPublic, true);
          bus.Publish(event);
          return kExitOk;
        },
        [&](tg::Fault fault) { return ReportFault(bus, fault, "command.run"); });
  }

  class TermiosGuard {
  public:
    TermiosGuard(int fd, const termios& state) : fd_(fd), state_(state), restored_(false) {}
    ~TermiosGuard() {
      Restore();
    }
    void Restore() {
      if (!restored_) {
        tcsetattr(fd_, TCSAFLUSH, &state_);
        restored_ = true;
      }
    }

  private:
    int fd_;
    termios state_;
    bool restored_;
  };

  // One line from stdin, echo off on a terminal. The line is collected in a
  // fixed buffer that is wiped on every exit path, unwinding included.
  std::optional<std::string> ReadSecretLine() {
    std::optional<TermiosGuard> guard;
    if (::isatty(STDIN_FILENO)) {
      termios original{};
      if (tcgetattr(STDIN_FILENO, &original) != 0) {
        throw std::system_error(errno, std::generic_category(), "terminal query failed");
      }
      guard.emplace(STDIN_FILENO, original);
      termios silent = original;
      silent.c_lflag &= ~ECHO;
      if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) != 0) {
        throw std::system_error(errno, std::generic_category(), "unable to disable echo");
      }
      std::cerr << "Secret: " << std::flush;
    }

    std::array<char, kMaxSecretLen> buffer{};
    tg::security::Zeroizer::ScopeWiper<char> wiper(buffer.data(), buffer.size());
    std::size_t length = 0;
    bool overflow = false;
    while (true) {
      char ch = 0;
      const ssize_t n = ::read(STDIN_FILENO, &ch, 1);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        throw std::system_error(errno, std::generic_category(), "failed to read secret");
      }
      if (n == 0 || ch == '\n') {
        break;
      }
      if (ch == '\r') {
        continue;
      }
      if (length >= buffer.size()) {
        overflow = true;
        continue;
      }
      buffer[length++] = ch;
    }
    if (guard) {
      guard->Restore();
      std::cerr << std::endl;
    }
    if (overflow) {
      return std::nullopt;
    }
    return std::string(buffer.data(), length);
  }

  int HandleSecret(tg::diagnostics::EventBus& bus, const tg::ToolkitConfig& config) {
    auto line = ReadSecretLine();
    if (!line) {
      std::cerr << "error: secret exceeds " << kMaxSecretLen << " bytes" << std::endl;
      return kExitUsage;
    }
    return tg::security::SecretString::Create(std::move(*line), tg::SecretOptionsFrom(config))
        .Match(
            [](tg::security::SecretString secret) {
              std::cout << secret << " (" << secret.Size() << " bytes"
                        << (secret.IsLocked() ? ", locked" : "") << ")" << std::endl;
              return kExitOk;
            },
            [&](tg::Fault fault) { return ReportFault(bus, fault, "secret.store"); });
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    auto loaded = tg::LoadConfigFromEnvironment();
    if (const tg::Fault* fault = loaded.TryFault()) {
      std::cerr << "Configuration error: " << *fault << std::endl;
      return kExitConfig;
    }
    const tg::ToolkitConfig config = *loaded.TryValue();

    tg::diagnostics::EventBus bus(config.min_log_severity);
    bus.Subscribe(tg::diagnostics::StreamSink(std::clog));

    const std::string_view cmd = argv[1];
    if (cmd == "path" || cmd == "path-new") {
      if (argc != 4) {
        PrintUsage();
        return kExitUsage;
      }
      return HandlePath(bus, config, std::filesystem::path(argv[2]), argv[3], cmd == "path-new");
    }
    if (cmd == "run") {
      return HandleRun(bus, config, argc, argv, 2);
    }
    if (cmd == "secret") {
      if (argc != 2) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleSecret(bus, config);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return kExitOsError;
  }
}
