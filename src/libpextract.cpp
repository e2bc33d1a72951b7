/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exported functions of the pattern extraction library
/// \file libpextract.cpp
#include "pextract/lib/extract.hpp"
#include "strus/errorBufferInterface.hpp"
#include "patternRegistry.hpp"
#include "patternExtractor.hpp"
#include "standardPatterns.hpp"
#include "strus/base/dll_tags.hpp"
#include "internationalization.hpp"
#include "errorUtils.hpp"

using namespace pextract;
static bool g_intl_initialized = false;

DLL_PUBLIC PatternRegistryInterface* pextract::createPatternRegistry( strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		if (!g_intl_initialized)
		{
			pextract::initMessageTextDomain();
			g_intl_initialized = true;
		}
		return new PatternRegistry( errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating pattern registry: %s"), *errorhnd, 0);
}

DLL_PUBLIC bool pextract::defineStandardPatterns( PatternRegistryInterface* registry, strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		if (!g_intl_initialized)
		{
			pextract::initMessageTextDomain();
			g_intl_initialized = true;
		}
		if (!registry)
		{
			throw pextract::runtime_error( _TXT("no registry passed"));
		}
		defineStandardPatternTable( *registry, errorhnd);
		return true;
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error defining standard patterns: %s"), *errorhnd, false);
}

DLL_PUBLIC PatternRegistryInterface* pextract::createStandardPatternRegistry( strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		if (!g_intl_initialized)
		{
			pextract::initMessageTextDomain();
			g_intl_initialized = true;
		}
		return createStandardPatternRegistryHandle( errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating standard pattern registry: %s"), *errorhnd, 0);
}

DLL_PUBLIC PatternExtractorInterface* pextract::createPatternExtractor_hyperscan( strus::ErrorBufferInterface* errorhnd)
{
	try
	{
		if (!g_intl_initialized)
		{
			pextract::initMessageTextDomain();
			g_intl_initialized = true;
		}
		return new PatternExtractor( errorhnd);
	}
	CATCH_ERROR_MAP_RETURN( _TXT("error creating hyperscan pattern extractor: %s"), *errorhnd, 0);
}

