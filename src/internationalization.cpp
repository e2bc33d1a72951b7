/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Message text translation and formatted exceptions
/// \file "internationalization.cpp"
#include "internationalization.hpp"
#include <cstdarg>
#include <cstdio>

std::runtime_error pextract::runtime_error( const char* format, ...)
{
	char msgbuf[ 4096];
	va_list ap;
	va_start( ap, format);
	int len = ::vsnprintf( msgbuf, sizeof(msgbuf), format, ap);
	va_end( ap);
	if (len < 0)
	{
		return std::runtime_error( format);
	}
	msgbuf[ sizeof(msgbuf)-1] = 0;
	return std::runtime_error( msgbuf);
}

void pextract::initMessageTextDomain()
{
	bindtextdomain( PEXTRACT_GETTEXT_PACKAGE, PEXTRACT_GETTEXT_LOCALEDIR);
}

