#include "conversionerror.h"

QString ConversionError::codeName(Code code)
{
    switch (code) {
    case None:             return QStringLiteral("NONE");
    case EmptyContent:     return QStringLiteral("EMPTY_CONTENT");
    case NoValidBlocks:    return QStringLiteral("NO_VALID_BLOCKS");
    case CapacityExceeded: return QStringLiteral("CAPACITY_EXCEEDED");
    case RendererFailed:   return QStringLiteral("RENDERER_FAILED");
    case RendererShutdown: return QStringLiteral("RENDERER_SHUTDOWN");
    case EmptyDocument:    return QStringLiteral("EMPTY_DOCUMENT");
    case ArchiveFailed:    return QStringLiteral("ARCHIVE_FAILED");
    case StorageFailed:    return QStringLiteral("STORAGE_FAILED");
    case LimitDenied:      return QStringLiteral("LIMIT_DENIED");
    case BatchNotAllowed:  return QStringLiteral("BATCH_NOT_ALLOWED");
    case TooManyFiles:     return QStringLiteral("TOO_MANY_FILES");
    case FileTooLarge:     return QStringLiteral("FILE_TOO_LARGE");
    case NotFound:         return QStringLiteral("NOT_FOUND");
    case NotReady:         return QStringLiteral("NOT_READY");
    }
    return QStringLiteral("UNKNOWN");
}
