#include <backscan/reader/error.h>

namespace backscan {

std::string ReaderError::format_message(Type type, const std::string &message) {
    std::string prefix;
    switch (type) {
        case INVALID_ARGUMENT:
            prefix = "[INVALID_ARGUMENT]";
            break;
        case FILE_IO_ERROR:
            prefix = "[FILE_IO]";
            break;
        case READ_ERROR:
            prefix = "[READ]";
            break;
        case INITIALIZATION_ERROR:
            prefix = "[INITIALIZATION]";
            break;
        case UNKNOWN_ERROR:
            prefix = "[UNKNOWN]";
            break;
    }
    return prefix + " " + message;
}

}  // namespace backscan
