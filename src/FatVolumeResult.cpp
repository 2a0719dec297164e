#include "FatVolumeResult.h"

const char* toString(FatVolumeResult result) {
  switch (result) {
    case FatVolumeResult::Success:
      return "Success";
    case FatVolumeResult::IoError:
      return "IoError";
    case FatVolumeResult::InvalidFat32Structure:
      return "InvalidFat32Structure";
    case FatVolumeResult::FileNotFound:
      return "FileNotFound";
    case FatVolumeResult::InvalidPath:
      return "InvalidPath";
    case FatVolumeResult::BufferTooSmall:
      return "BufferTooSmall";
  }
  return "Unknown";
}
