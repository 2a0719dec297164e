#ifndef FAT_VOLUME_RESULT_H
#define FAT_VOLUME_RESULT_H

/**
 * @brief Result codes for FAT32 volume operations.
 *
 * FileNotFound and InvalidPath belong to the directory layer built on top of
 * this library. They live here so that layer can share one error type.
 */
enum class FatVolumeResult {
  Success = 0,
  IoError,
  InvalidFat32Structure,
  FileNotFound,
  InvalidPath,
  BufferTooSmall
};

/**
 * @brief Stable, human readable name of a result code (e.g. "IoError").
 */
const char* toString(FatVolumeResult result);

#endif  // FAT_VOLUME_RESULT_H
