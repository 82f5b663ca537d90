#include <backscan/source/file_source.h>
#include <backscan/source/memory_source.h>
#include <backscan/source/source.h>

#include <exception>

#include "backscan/common/logging.h"

// ==============================================================================
// C API Implementation (wraps C++ implementation)
// ==============================================================================

extern "C" {

backscan_source_handle_t backscan_file_source_create(const char *path) {
    if (!path) {
        BACKSCAN_LOG_ERROR("Invalid parameters for file source creation");
        return nullptr;
    }

    try {
        backscan::RandomAccessSource *source = new backscan::FileSource(path);
        return static_cast<backscan_source_handle_t>(source);
    } catch (const std::exception &e) {
        BACKSCAN_LOG_ERROR("Failed to create file source: {}", e.what());
        return nullptr;
    }
}

backscan_source_handle_t backscan_memory_source_create(const char *data,
                                                       size_t size) {
    if (!data && size > 0) {
        BACKSCAN_LOG_ERROR("Invalid parameters for memory source creation");
        return nullptr;
    }

    try {
        backscan::RandomAccessSource *source =
            new backscan::MemorySource(data, size);
        return static_cast<backscan_source_handle_t>(source);
    } catch (const std::exception &e) {
        BACKSCAN_LOG_ERROR("Failed to create memory source: {}", e.what());
        return nullptr;
    }
}

int backscan_source_size(backscan_source_handle_t source, size_t *size) {
    if (!source || !size) {
        return -1;
    }
    *size = static_cast<backscan::RandomAccessSource *>(source)->size();
    return 0;
}

void backscan_source_destroy(backscan_source_handle_t source) {
    if (source) {
        delete static_cast<backscan::RandomAccessSource *>(source);
    }
}

}  // extern "C"
