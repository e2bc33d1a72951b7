/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Message text translation and formatted exceptions
/// \file "internationalization.hpp"
#ifndef _PEXTRACT_INTERNATIONALIZATION_HPP_INCLUDED
#define _PEXTRACT_INTERNATIONALIZATION_HPP_INCLUDED
#include <libintl.h>
#include <stdexcept>

#ifndef PEXTRACT_GETTEXT_PACKAGE
#define PEXTRACT_GETTEXT_PACKAGE "pextract-dom"
#endif
#ifndef PEXTRACT_GETTEXT_LOCALEDIR
#define PEXTRACT_GETTEXT_LOCALEDIR "/usr/local/share/locale"
#endif

#define _TXT(STRING) dgettext( PEXTRACT_GETTEXT_PACKAGE, STRING)

namespace pextract {

/// \brief Create a runtime error exception with a message formatted like printf
std::runtime_error runtime_error( const char* format, ...)
#ifdef __GNUC__
	__attribute__ ((format (printf, 1, 2)))
#endif
	;

/// \brief Bind the text domain of the messages of this library
void initMessageTextDomain();

}//namespace
#endif

