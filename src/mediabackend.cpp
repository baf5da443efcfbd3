/*
 * waexporter: A free and open-source WhatsApp media export tool.
 *
 * Copyright (C) 2025 Uncore <https://github.com/uncor3>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */


#include "mediabackend.h"
#include "localbackend.h"
#include "remotebackend.h"

std::unique_ptr<MediaBackend> createMediaBackend(const ExportRequest &request,
                                                 AdbBridge *bridge)
{
    switch (request.backendKind) {
    case BackendKind::Remote:
        return std::make_unique<RemoteBackend>(bridge, request.locator);
    case BackendKind::Local:
        return std::make_unique<LocalBackend>(request.locator);
    }
    return nullptr;
}
