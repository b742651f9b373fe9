#include "tg/boundary/path_guard.h"
#include "tg/diagnostics/event_bus.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

  class TempDir {
  public:
    TempDir() {
      auto base = std::filesystem::temp_directory_path();
      static int sequence = 0;
      auto name = std::string{"tg_path_guard_"} +
                  std::to_string(static_cast<unsigned long long>(std::chrono::steady_clock::now()
                                                                     .time_since_epoch()
                                                                     .count())) +
                  "_" + std::to_string(++sequence);
      path_ = std::filesystem::canonical(base) / name;
      std::filesystem::create_directories(path_);
    }

    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_{};
  };

  void WriteFile(const std::filesystem::path& path, std::string_view contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << contents;
  }

  // Layout:
  //   <tmp>/data/reports/q1.csv
  //   <tmp>/data/notes.txt
  //   <tmp>/data/escape   -> <tmp>/outside
  //   <tmp>/data/sibling  -> <tmp>/data2
  //   <tmp>/data/inner    -> <tmp>/data/reports
  //   <tmp>/outside/secret.txt
  //   <tmp>/data2/file.txt
  struct Fixture {
    TempDir temp;
    std::filesystem::path root;

    Fixture() : root(temp.path() / "data") {
      WriteFile(root / "reports" / "q1.csv", "quarter,revenue\n");
      WriteFile(root / "notes.txt", "notes");
      WriteFile(temp.path() / "outside" / "secret.txt", "do not read");
      WriteFile(temp.path() / "data2" / "file.txt", "sibling");
      std::filesystem::create_directory_symlink(temp.path() / "outside", root / "escape");
      std::filesystem::create_directory_symlink(temp.path() / "data2", root / "sibling");
      std::filesystem::create_directory_symlink(root / "reports", root / "inner");
    }

    tg::boundary::PathGuard Guard(tg::boundary::PathGuardOptions options = {}) const {
      auto created = tg::boundary::PathGuard::Create(root, options);
      assert(created.IsSuccess());
      return std::move(*created.TryValue());
    }
  };

  void ExpectTraversal(const tg::boundary::PathGuard& guard, std::string_view candidate) {
    auto result = guard.Validate(candidate);
    if (!result.IsFailure() || !result.TryFault()->Is(tg::FaultKind::kPathTraversal)) {
      std::cerr << "expected traversal rejection for candidate #" << candidate.size() << std::endl;
      assert(false);
    }
    assert(!result.TryFault()->IsRetryable());
  }

  void TestValidNestedPaths() {
    Fixture fx;
    auto guard = fx.Guard();

    auto file = guard.Validate("reports/q1.csv");
    assert(file.IsSuccess());
    const auto& validated = *file.TryValue();
    assert(validated.Path() == std::filesystem::canonical(fx.root / "reports" / "q1.csv"));
    assert(validated.Root() == guard.Root());
    assert(validated.Relative() == std::filesystem::path("reports") / "q1.csv");

    auto dotted = guard.Validate("./reports/./q1.csv");
    assert(dotted.IsSuccess());
    assert(dotted.TryValue()->Path() == validated.Path());

    // A symlink that stays inside the root is fine; the canonical target is returned.
    auto via_link = guard.Validate("inner/q1.csv");
    assert(via_link.IsSuccess());
    assert(via_link.TryValue()->Path() == validated.Path());
  }

  void TestLexicalRejections() {
    Fixture fx;
    auto guard = fx.Guard();

    ExpectTraversal(guard, "../etc/passwd");
    ExpectTraversal(guard, "reports/../../outside/secret.txt");
    ExpectTraversal(guard, "..");
    ExpectTraversal(guard, "/etc/passwd");
    ExpectTraversal(guard, "C:secret");
    ExpectTraversal(guard, "reports\\q1.csv");
    ExpectTraversal(guard, "%2e%2e/etc/passwd");
    ExpectTraversal(guard, "reports%2Fq1.csv");
    ExpectTraversal(guard, "reports%5cq1.csv");
    ExpectTraversal(guard, std::string_view("notes.txt\0.png", 14));
    ExpectTraversal(guard, "notes\n.txt");
    ExpectTraversal(guard, "\xff\xfe");
    ExpectTraversal(guard, "reports\xE2\x88\x95q1.csv"); // U+2215 division slash
    ExpectTraversal(guard, "\xE2\x80\xAEtxt.exe");       // U+202E right-to-left override
    ExpectTraversal(guard, "");

    // ".." only counts as a whole segment.
    WriteFile(fx.root / "v1..2.txt", "x");
    auto dots = guard.Validate("v1..2.txt");
    assert(dots.IsSuccess());
  }

  void TestSymlinkEscapesAreRejected() {
    Fixture fx;
    auto guard = fx.Guard();

    ExpectTraversal(guard, "escape/secret.txt");
    ExpectTraversal(guard, "escape");
    // <tmp>/data2 shares a string prefix with <tmp>/data but is not inside it.
    ExpectTraversal(guard, "sibling/file.txt");
  }

  void TestMissingEntries() {
    Fixture fx;
    auto guard = fx.Guard();

    auto missing = guard.Validate("reports/q2.csv");
    assert(missing.IsFailure());
    assert(missing.TryFault()->Is(tg::FaultKind::kNotFound));
    assert(missing.TryFault()->IsRetryable());
    assert(missing.TryFault()->native_code.has_value());

    std::filesystem::create_symlink(fx.root / "nowhere", fx.root / "dangling");
    auto dangling = guard.Validate("dangling");
    assert(dangling.IsFailure());
    assert(dangling.TryFault()->Is(tg::FaultKind::kNotFound));
  }

  void TestValidateForCreate() {
    Fixture fx;
    auto guard = fx.Guard();

    auto fresh = guard.ValidateForCreate("reports/q2.csv");
    assert(fresh.IsSuccess());
    assert(fresh.TryValue()->Path() ==
           std::filesystem::canonical(fx.root / "reports") / "q2.csv");
    assert(!std::filesystem::exists(fx.root / "reports" / "q2.csv"));

    auto top_level = guard.ValidateForCreate("upload.bin");
    assert(top_level.IsSuccess());
    assert(top_level.TryValue()->Relative() == std::filesystem::path("upload.bin"));

    auto existing = guard.ValidateForCreate("notes.txt");
    assert(existing.IsSuccess());

    auto no_parent = guard.ValidateForCreate("archive/2024/q1.csv");
    assert(no_parent.IsFailure());
    assert(no_parent.TryFault()->Is(tg::FaultKind::kNotFound));

    auto escaped_parent = guard.ValidateForCreate("escape/planted.txt");
    assert(escaped_parent.IsFailure());
    assert(escaped_parent.TryFault()->Is(tg::FaultKind::kPathTraversal));
    assert(!std::filesystem::exists(fx.temp.path() / "outside" / "planted.txt"));

    // A dangling link counts as existing, so writing through it is refused.
    const auto outside_target = fx.temp.path() / "outside" / "new.txt";
    std::filesystem::create_symlink(outside_target, fx.root / "planted");
    auto through_link = guard.ValidateForCreate("planted");
    assert(through_link.IsFailure());
    assert(through_link.TryFault()->Is(tg::FaultKind::kNotFound));
    auto nested_link = guard.ValidateForCreate("./planted");
    assert(nested_link.IsFailure());
    assert(nested_link.TryFault()->Is(tg::FaultKind::kNotFound));
    assert(!std::filesystem::exists(outside_target));
    assert(std::filesystem::is_symlink(fx.root / "planted"));

    auto file_parent = guard.ValidateForCreate("notes.txt/child");
    assert(file_parent.IsFailure());

    auto lexical = guard.ValidateForCreate("../planted.txt");
    assert(lexical.IsFailure());
    assert(lexical.TryFault()->Is(tg::FaultKind::kPathTraversal));
  }

  void TestInvalidRoots() {
    TempDir temp;
    auto missing = tg::boundary::PathGuard::Create(temp.path() / "does-not-exist");
    assert(missing.IsFailure());
    assert(missing.TryFault()->Is(tg::FaultKind::kInvalidRoot));
    assert(!missing.TryFault()->IsRetryable());

    WriteFile(temp.path() / "plain.txt", "x");
    auto file_root = tg::boundary::PathGuard::Create(temp.path() / "plain.txt");
    assert(file_root.IsFailure());
    assert(file_root.TryFault()->Is(tg::FaultKind::kInvalidRoot));

    auto empty_root = tg::boundary::PathGuard::Create(std::filesystem::path{});
    assert(empty_root.IsFailure());
    assert(empty_root.TryFault()->Is(tg::FaultKind::kInvalidRoot));
  }

  void TestRootIsCanonicalized() {
    Fixture fx;
    std::filesystem::create_directory_symlink(fx.root, fx.temp.path() / "data-link");
    auto created = tg::boundary::PathGuard::Create(fx.temp.path() / "data-link" / ".");
    assert(created.IsSuccess());
    assert(created.TryValue()->Root() == std::filesystem::canonical(fx.root));
  }

  void TestAuditSubjectIsTruncated() {
    Fixture fx;
    tg::boundary::PathGuardOptions options;
    options.audit_subject_max = 8;
    auto guard = fx.Guard(options);

    const std::string hostile = "../" + std::string(200, 'A');
    auto result = guard.Validate(hostile);
    assert(result.IsFailure());
    const auto& subject = result.TryFault()->subject;
    assert(subject == "../AAAAA...");
  }

  void TestEndToEndScenario() {
    Fixture fx;
    auto guard = fx.Guard();

    tg::diagnostics::EventBus bus(tg::diagnostics::EventSeverity::kDebug);
    auto events = std::make_shared<std::vector<tg::diagnostics::Event>>();
    bus.Subscribe([events](const tg::diagnostics::Event& e) { events->push_back(e); });

    auto attack = guard.Validate("../etc/passwd");
    assert(attack.IsFailure());
    assert(attack.TryFault()->Is(tg::FaultKind::kPathTraversal));
    const bool logged = std::move(attack).LogAndDrop(bus, "serve_report");
    assert(logged);
    assert(events->size() == 1);
    assert(events->front().category == tg::diagnostics::EventCategory::kSecurity);

    auto report = guard.Validate("reports/q1.csv");
    assert(report.IsSuccess());
    assert(report.TryValue()->Path() == guard.Root() / "reports" / "q1.csv");
    std::ifstream in(report.TryValue()->Path());
    std::string header;
    std::getline(in, header);
    assert(header == "quarter,revenue");
  }

} // namespace

int main() {
  TestValidNestedPaths();
  TestLexicalRejections();
  TestSymlinkEscapesAreRejected();
  TestMissingEntries();
  TestValidateForCreate();
  TestInvalidRoots();
  TestRootIsCanonicalized();
  TestAuditSubjectIsTruncated();
  TestEndToEndScenario();
  std::cout << "test_path_guard completed" << std::endl;
  return 0;
}
