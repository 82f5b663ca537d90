#ifndef BACKSCAN_SOURCE_SOURCE_H
#define BACKSCAN_SOURCE_SOURCE_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stddef.h>
#include <stdint.h>

/**
 * Opaque handle for a random-access byte source
 */
typedef void *backscan_source_handle_t;

/**
 * Open a file as a random-access source
 * @param path Path to the file
 * @return Source handle, or NULL on failure
 */
backscan_source_handle_t backscan_file_source_create(const char *path);

/**
 * Create a source over a copy of the given bytes
 * @param data Bytes to copy (may be NULL when size is 0)
 * @param size Number of bytes
 * @return Source handle, or NULL on failure
 */
backscan_source_handle_t backscan_memory_source_create(const char *data,
                                                       size_t size);

/**
 * Get the total size of the source in bytes
 * @return 0 on success, -1 on error
 */
int backscan_source_size(backscan_source_handle_t source, size_t *size);

void backscan_source_destroy(backscan_source_handle_t source);

#ifdef __cplusplus
}  // extern "C"

#include <cstddef>

namespace backscan {

struct ReadResult {
    std::size_t bytes;
    bool end_of_source;
};

/**
 * Random-access byte provider read by BackwardLineReader.
 *
 * read_at() delivers `size` bytes starting at `offset` unless the end of the
 * source is reached first. `end_of_source` is set when `offset + bytes`
 * reaches the end; implementations may set it on a read that was fully
 * satisfied. I/O failures are thrown (normally as ReaderError).
 */
class RandomAccessSource {
   public:
    virtual ~RandomAccessSource() = default;

    virtual ReadResult read_at(std::size_t offset, char *buffer,
                               std::size_t size) = 0;

    /**
     * Total number of bytes in the source
     */
    virtual std::size_t size() const = 0;

    virtual bool supports_close() const { return false; }
    virtual void close() {}
};

}  // namespace backscan
#endif

#endif  // BACKSCAN_SOURCE_SOURCE_H
