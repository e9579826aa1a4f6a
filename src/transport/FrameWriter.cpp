#include "transport/FrameWriter.h"

FrameWriter::Status FrameWriter::write(const std::string& frame, const WriteFn& writeFn,
                                       const WritableFn& writable) {
    if (writable && !writable()) {
        consecutive++;
        return consecutive >= maxFailures ? Status::Broken : Status::Deferred;
    }
    if (!writeFn(frame.data(), frame.size())) {
        consecutive = maxFailures;
        return Status::Broken;
    }
    consecutive = 0;
    return Status::Written;
}
