//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Lesser General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Lesser General Public License for more details.
//
// You should have received a copy of the GNU Lesser General Public License
// along with this program.  If not, see http://www.gnu.org/licenses/.
//

/*!
 * @file geohash_proj.h
 */

#pragma once

#include <omnetpp.h>

//! Versión del proyecto ("major.minor").
#define GEOHASH_PROJ_VERSION_MAJOR 1
#define GEOHASH_PROJ_VERSION_MINOR 0

#if OMNETPP_VERSION < 0x0500
#error At least OMNeT++/OMNEST version 5.0 required
#endif

#if defined(GEOHASH_PROJ_EXPORT)
#define GEOHASH_PROJ_API OPP_DLLEXPORT
#elif defined(GEOHASH_PROJ_IMPORT)
#define GEOHASH_PROJ_API OPP_DLLIMPORT
#else
#define GEOHASH_PROJ_API
#endif
