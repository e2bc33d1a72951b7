/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Version of the pattern extraction library
/// \file versionExtract.hpp
#ifndef _PEXTRACT_VERSION_EXTRACT_HPP_INCLUDED
#define _PEXTRACT_VERSION_EXTRACT_HPP_INCLUDED

/// \brief pextract toplevel namespace
namespace pextract
{

/// \brief Version number of the pattern extraction library
#define PEXTRACT_VERSION (\
	0 * 1000000\
	+ 4 * 10000\
	+ 2\
)

/// \brief Major version number of the pattern extraction library
#define PEXTRACT_VERSION_MAJOR 0
/// \brief Minor version number of the pattern extraction library
#define PEXTRACT_VERSION_MINOR 4

/// \brief The version of the pattern extraction library
#define PEXTRACT_VERSION_STRING "0.4.2"

}//namespace
#endif

