// Builds FAT32 images on disk and checks what inspect_image reports for them.
//
// Usage: integration_runner <path-to-inspect_image>

#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <print>
#include <stdexcept>
#include <string>
#include <vector>

#include "MemoryBlockDevice.h"
#include "TestImage.h"

namespace fs = std::filesystem;

using fatVolumeTest::VolumeParams;
using std::println;

// Helper to run shell commands and capture output
std::pair<int, std::string> runCommand(const std::string& cmd) {
  std::array<char, 128> buffer;
  std::string result;
  std::string fullCmd = cmd + " 2>&1";  // Capture stderr too
  FILE* pipe = popen(fullCmd.c_str(), "r");

  if (!pipe) {
    throw std::runtime_error("popen() failed!");
  }

  while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
    result += buffer.data();
  }

  int status = pclose(pipe);
  int rc = -1;
  if (WIFEXITED(status)) {
    rc = WEXITSTATUS(status);
  }

  return {rc, result};
}

bool expectContains(const std::string& output, const std::string& needle) {
  if (output.find(needle) == std::string::npos) {
    println(stderr, "    [!] Missing from output: '{}'", needle);
    return false;
  }
  return true;
}

struct Scenario {
  std::string name;
  std::function<fatVolume::MemoryBlockDevice()> buildImage;
  std::string extraArgs;
  int expectedExitCode;
  std::vector<std::string> expectedOutput;
};

bool runTest(const std::string& tool, const Scenario& scenario) {
  println("------------------------------------------------");
  println("Running Test: {}", scenario.name);
  const fs::path imgFile =
      fs::temp_directory_path() /
      ("fatvolume_it_" + std::to_string(getpid()) + ".img");

  try {
    println("[*] Creating image...");
    fatVolume::MemoryBlockDevice image = scenario.buildImage();
    fatVolumeTest::writeImageFile(imgFile.string(), image);

    println("[*] Inspecting...");
    std::string cmd = tool + " " + imgFile.string();
    if (!scenario.extraArgs.empty()) {
      cmd += " " + scenario.extraArgs;
    }
    auto [rc, out] = runCommand(cmd);

    bool passed = true;
    if (rc != scenario.expectedExitCode) {
      println(stderr, "    [!] Exit code {} (expected {}):\n{}", rc,
              scenario.expectedExitCode, out);
      passed = false;
    } else {
      println("    [+] Exit code {}", rc);
    }

    for (const auto& needle : scenario.expectedOutput) {
      passed &= expectContains(out, needle);
    }

    fs::remove(imgFile);
    return passed;

  } catch (const std::exception& e) {
    println(stderr, "Exception: {}", e.what());
    if (fs::exists(imgFile)) {
      fs::remove(imgFile);
    }
    return false;
  }
}

// Copies a volume into a larger disk at startLba, leaving the sectors before
// it blank.
fatVolume::MemoryBlockDevice placeAt(fatVolume::MemoryBlockDevice& volume,
                                     uint32_t startLba) {
  fatVolume::MemoryBlockDevice disk(startLba + volume.sectorCount());
  for (uint32_t lba = 0; lba < volume.sectorCount(); lba++) {
    std::ranges::copy(volume.sector(lba), disk.sector(startLba + lba).begin());
  }
  return disk;
}

int main(int argc, char* argv[]) {
  if (argc != 2) {
    println(stderr, "Usage: integration_runner <path-to-inspect_image>");
    return 1;
  }
  const std::string tool = argv[1];
  if (!fs::exists(tool)) {
    println(stderr, "Error: {} not found. Build inspect_image first.", tool);
    return 1;
  }

  const VolumeParams params;

  const std::vector<Scenario> scenarios = {
      {
          "fresh volume",
          [&] { return fatVolumeTest::makeVolumeDevice(params); },
          "",
          0,
          {"First data sector: 232", "Cluster count:     2442",
           "Label:             'TESTVOLUME '", "FSInfo free count: 2441",
           "Clean shutdown:    yes", "cluster 2 at LBA 232",
           "Root chain: 1 cluster(s)"},
      },
      {
          "multi-cluster root directory",
          [&] {
            auto device = fatVolumeTest::makeVolumeDevice(params);
            fatVolumeTest::setFatEntry(device, params, 2, 9);
            fatVolumeTest::setFatEntry(device, params, 9, 300);
            fatVolumeTest::setFatEntry(device, params, 300, 0x0FFFFFF8);
            return device;
          },
          "",
          0,
          {"cluster 9 at LBA 260", "cluster 300 at LBA 1424",
           "Root chain: 3 cluster(s)"},
      },
      {
          "partition at 4 MB",
          [&] {
            auto device = fatVolumeTest::makeVolumeDevice(params);
            return placeAt(device, 8192);
          },
          "8192",
          0,
          {"at LBA 8192", "First data sector: 232", "Root chain: 1 cluster(s)"},
      },
      {
          "missing partition offset",
          [&] {
            auto device = fatVolumeTest::makeVolumeDevice(params);
            return placeAt(device, 8192);
          },
          "",
          1,
          {"InvalidFat32Structure"},
      },
      {
          "bad boot signature",
          [&] {
            VolumeParams broken = params;
            broken.signature = 0x55AA;
            return fatVolumeTest::makeVolumeDevice(broken);
          },
          "",
          1,
          {"mount failed (InvalidFat32Structure)"},
      },
      {
          "cyclic root chain",
          [&] {
            auto device = fatVolumeTest::makeVolumeDevice(params);
            fatVolumeTest::setFatEntry(device, params, 2, 3);
            fatVolumeTest::setFatEntry(device, params, 3, 2);
            return device;
          },
          "",
          1,
          {"root chain broken after 2442 cluster(s) (InvalidFat32Structure)"},
      },
      {
          "bad cluster in root chain",
          [&] {
            auto device = fatVolumeTest::makeVolumeDevice(params);
            fatVolumeTest::setFatEntry(device, params, 2, 0x0FFFFFF7);
            return device;
          },
          "",
          1,
          {"cluster 2 at LBA 232",
           "root chain broken after 1 cluster(s) (InvalidFat32Structure)"},
      },
  };

  int failed = 0;
  for (const auto& scenario : scenarios) {
    if (!runTest(tool, scenario)) {
      println("RESULT: [FAILED] {}", scenario.name);
      failed++;
      continue;
    }
    println("RESULT: [PASSED] {}", scenario.name);
  }

  println("------------------------------------------------");
  if (failed == 0) {
    println("ALL TESTS PASSED");
    return 0;
  } else {
    println("{} TEST(S) FAILED", failed);
    return 1;
  }
}
