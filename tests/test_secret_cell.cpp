#include "tg/security/secret_cell.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

  using tg::security::SecretBytes;
  using tg::security::SecretCellOptions;
  using tg::security::SecretString;

  // Storage contents seen by the release hook, shared so tests can inspect
  // them after the cell is gone.
  struct ReleaseProbe {
    std::vector<std::uint8_t> bytes;
    int calls{0};
  };

  SecretCellOptions ProbedOptions(const std::shared_ptr<ReleaseProbe>& probe,
                                  std::uint8_t pattern = 0x00) {
    SecretCellOptions options;
    options.wipe_pattern = pattern;
    options.lock_policy = tg::security::LockPolicy::kOff;
    options.before_release = [probe](std::span<const std::uint8_t> storage) {
      probe->bytes.assign(storage.begin(), storage.end());
      ++probe->calls;
    };
    return options;
  }

  bool AllEqual(const std::vector<std::uint8_t>& bytes, std::uint8_t value) {
    return std::all_of(bytes.begin(), bytes.end(), [value](std::uint8_t b) { return b == value; });
  }

  bool Contains(const std::vector<std::uint8_t>& haystack, std::string_view needle) {
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                       [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); }) !=
           haystack.end();
  }

  void TestScrubOnDrop() {
    auto probe = std::make_shared<ReleaseProbe>();
    {
      SecretString secret(std::string("s3cr3t-api-key"), ProbedOptions(probe));
      const bool matches = secret.Expose([](std::string_view v) { return v == "s3cr3t-api-key"; });
      assert(matches);
    }
    assert(probe->calls == 1);
    assert(!probe->bytes.empty());
    assert(AllEqual(probe->bytes, 0x00));
    assert(!Contains(probe->bytes, "s3cr3t"));
  }

  void TestScrubUsesConfiguredPattern() {
    auto probe = std::make_shared<ReleaseProbe>();
    {
      SecretBytes key(std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6, 7, 8}, ProbedOptions(probe, 0xCC));
      assert(key.Size() == 8);
    }
    assert(probe->calls == 1);
    assert(AllEqual(probe->bytes, 0xCC));
  }

  void TestScrubDuringUnwinding() {
    auto probe = std::make_shared<ReleaseProbe>();
    bool caught = false;
    try {
      SecretString secret(std::string("unwinding-secret"), ProbedOptions(probe));
      throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
      caught = true;
    }
    assert(caught);
    assert(probe->calls == 1);
    assert(!Contains(probe->bytes, "unwinding"));
  }

  void TestSourceContainersAreWiped() {
    std::string text = "password-from-config-file";
    SecretString secret(std::move(text));
    assert(text.empty());
    assert(secret.Size() == std::string_view("password-from-config-file").size());

    std::vector<std::uint8_t> raw{9, 9, 9, 9};
    SecretBytes bytes(std::move(raw));
    assert(raw.empty());
    assert(bytes.Size() == 4);
  }

  void TestRedaction() {
    SecretString filled(std::string("hunter2"));
    SecretString empty(std::string{});
    SecretBytes bytes(std::vector<std::uint8_t>{0xDE, 0xAD});

    assert(filled.Redacted() == "[REDACTED]");
    assert(empty.Redacted() == "[REDACTED]");
    assert(bytes.Redacted() == "[REDACTED]");
    assert(empty.Empty());

    std::ostringstream out;
    out << filled << '|' << empty << '|' << bytes;
    assert(out.str() == "[REDACTED]|[REDACTED]|[REDACTED]");
    assert(out.str().find("hunter2") == std::string::npos);
  }

  void TestExposeReturnsDerivedValues() {
    SecretBytes key(std::vector<std::uint8_t>{1, 2, 3, 250});
    const int sum = key.Expose([](std::span<const std::uint8_t> view) {
      int total = 0;
      for (auto b : view) {
        total += b;
      }
      return total;
    });
    assert(sum == 256);

    SecretString token(std::string("Bearer abc"));
    const std::size_t prefix = token.Expose([](std::string_view view) { return view.find(' '); });
    assert(prefix == 6);
  }

  void TestClearAndMove() {
    auto probe = std::make_shared<ReleaseProbe>();
    SecretString first(std::string("rotate-me"), ProbedOptions(probe));
    SecretString second(std::move(first));
    assert(first.Empty());
    assert(second.Size() == 9);
    assert(probe->calls == 0);

    second.Clear();
    assert(second.Empty());
    assert(probe->calls == 1);
    assert(!Contains(probe->bytes, "rotate"));
    const bool empty_view = second.Expose([](std::string_view v) { return v.empty(); });
    assert(empty_view);
  }

  void TestCreateRespectsLockPolicy() {
    SecretCellOptions off;
    off.lock_policy = tg::security::LockPolicy::kOff;
    auto unlocked = SecretString::Create(std::string("value"), off);
    assert(unlocked.IsSuccess());
    assert(!unlocked.TryValue()->IsLocked());

    SecretCellOptions strict;
    strict.lock_policy = tg::security::LockPolicy::kStrict;
    auto locked = SecretString::Create(std::string("value"), strict);
    // Either the pages were pinned, or the strict policy refused the secret.
    if (const auto* cell = locked.TryValue()) {
      assert(cell->IsLocked());
    } else {
      assert(locked.TryFault()->Is(tg::FaultKind::kMemoryLockFailed));
    }
  }

} // namespace

int main() {
  TestScrubOnDrop();
  TestScrubUsesConfiguredPattern();
  TestScrubDuringUnwinding();
  TestSourceContainersAreWiped();
  TestRedaction();
  TestExposeReturnsDerivedValues();
  TestClearAndMove();
  TestCreateRespectsLockPolicy();
  std::cout << "test_secret_cell completed" << std::endl;
  return 0;
}
