/*
 * Copyright (c) 2014 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Mapping of hyperscan errors to error buffer codes and names
/// \file "hyperscanErrorCode.hpp"
#ifndef _PEXTRACT_HYPERSCAN_ERROR_CODE_HPP_INCLUDED
#define _PEXTRACT_HYPERSCAN_ERROR_CODE_HPP_INCLUDED
#include "strus/errorCodes.hpp"
#include "hs_common.h"

namespace pextract {

/// \brief Get the error code to report for a hyperscan error
static inline strus::ErrorCode hyperscanErrorCode( hs_error_t hs_error)
{
	switch (hs_error)
	{
		case HS_SUCCESS:		return strus::ErrorCodeUnknown;
		case HS_INVALID:		return strus::ErrorCodeInvalidArgument;
		case HS_NOMEM:			return strus::ErrorCodeOutOfMem;
		case HS_SCAN_TERMINATED:	return strus::ErrorCodeRuntimeError;
		case HS_COMPILER_ERROR:		return strus::ErrorCodeSyntax;
		case HS_DB_VERSION_ERROR:	return strus::ErrorCodeVersionMismatch;
		case HS_DB_PLATFORM_ERROR:	return strus::ErrorCodePlatformIncompatibility;
		case HS_DB_MODE_ERROR:		return strus::ErrorCodeNotImplemented;
		case HS_BAD_ALIGN:		return strus::ErrorCodeInvalidArgument;
		case HS_BAD_ALLOC:		return strus::ErrorCodeLogicError;
		case HS_SCRATCH_IN_USE:		return strus::ErrorCodeLogicError;
		case HS_ARCH_ERROR:		return strus::ErrorCodePlatformRequirements;
		case HS_INSUFFICIENT_SPACE:	return strus::ErrorCodeBufferOverflow;
	}
	return strus::ErrorCodeUnknown;
}

/// \brief Get the name of a hyperscan error for messages
static inline const char* hyperscanErrorName( hs_error_t hs_error)
{
	switch (hs_error)
	{
		case HS_SUCCESS:		return "HS_SUCCESS";
		case HS_INVALID:		return "HS_INVALID";
		case HS_NOMEM:			return "HS_NOMEM";
		case HS_SCAN_TERMINATED:	return "HS_SCAN_TERMINATED";
		case HS_COMPILER_ERROR:		return "HS_COMPILER_ERROR";
		case HS_DB_VERSION_ERROR:	return "HS_DB_VERSION_ERROR";
		case HS_DB_PLATFORM_ERROR:	return "HS_DB_PLATFORM_ERROR";
		case HS_DB_MODE_ERROR:		return "HS_DB_MODE_ERROR";
		case HS_BAD_ALIGN:		return "HS_BAD_ALIGN";
		case HS_BAD_ALLOC:		return "HS_BAD_ALLOC";
		case HS_SCRATCH_IN_USE:		return "HS_SCRATCH_IN_USE";
		case HS_ARCH_ERROR:		return "HS_ARCH_ERROR";
		case HS_INSUFFICIENT_SPACE:	return "HS_INSUFFICIENT_SPACE";
	}
	return "unknown";
}

}//namespace
#endif

