/** \file   DumpBridgeErrors.cc
 *  \brief  Implementation of error-related utility functions.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "DumpBridgeErrors.h"


namespace DumpBridge {


std::string ErrorKindToString(const ErrorKind error_kind) {
    switch (error_kind) {
    case CONNECTION:
        return "ConnectionError";
    case STREAM_INTERRUPTED:
        return "StreamInterrupted";
    case UPLOAD:
        return "UploadError";
    case DOWNLOAD:
        return "DownloadError";
    case INTEGRITY:
        return "IntegrityError";
    case MANIFEST_CORRUPT:
        return "ManifestCorrupt";
    case CONFIGURATION:
        return "ConfigurationError";
    case CANCELLED:
        return "Cancelled";
    }

    return "UnknownError";
}


} // namespace DumpBridge
