/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Exceptions thrown internally and macros mapping them to the error buffer at the interface boundary
/// \file "errorUtils.hpp"
#ifndef _PEXTRACT_ERROR_UTILS_HPP_INCLUDED
#define _PEXTRACT_ERROR_UTILS_HPP_INCLUDED
#include "strus/errorBufferInterface.hpp"
#include "strus/errorCodes.hpp"
#include "internationalization.hpp"
#include <stdexcept>
#include <string>
#include <new>

namespace pextract {

/// \brief Exception carrying an error code for the error buffer
class ErrorCodeException
	:public std::runtime_error
{
public:
	ErrorCodeException( int errorcode_, const std::string& msg)
		:std::runtime_error(msg),m_errorcode(errorcode_){}

	int errorcode() const
	{
		return m_errorcode;
	}

private:
	int m_errorcode;
};

/// \brief Exception thrown when a pattern name is defined twice
class DuplicateNameError
	:public ErrorCodeException
{
public:
	explicit DuplicateNameError( const std::string& name)
		:ErrorCodeException( strus::ErrorCodeDuplicateDefinition, std::string(_TXT("duplicate definition of pattern")) + " '" + name + "'"){}
};

/// \brief Exception thrown when a category is referenced that does not exist or a custom pattern is malformed
class UnknownPatternError
	:public ErrorCodeException
{
public:
	explicit UnknownPatternError( const std::string& msg)
		:ErrorCodeException( strus::ErrorCodeUnknownIdentifier, msg){}
};

}//namespace

#define CATCH_ERROR_MAP( contextExplainText, errorBuffer)\
	catch (const pextract::ErrorCodeException& err)\
	{\
		(errorBuffer).report( err.errorcode(), contextExplainText, err.what());\
	}\
	catch (const std::bad_alloc&)\
	{\
		(errorBuffer).report( strus::ErrorCodeOutOfMem, _TXT("memory allocation error"));\
	}\
	catch (const std::runtime_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeRuntimeError, contextExplainText, err.what());\
	}\
	catch (const std::exception& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeUncaughtException, contextExplainText, err.what());\
	}

#define CATCH_ERROR_MAP_RETURN( contextExplainText, errorBuffer, errorReturnValue)\
	catch (const pextract::ErrorCodeException& err)\
	{\
		(errorBuffer).report( err.errorcode(), contextExplainText, err.what());\
		return errorReturnValue;\
	}\
	catch (const std::bad_alloc&)\
	{\
		(errorBuffer).report( strus::ErrorCodeOutOfMem, _TXT("memory allocation error"));\
		return errorReturnValue;\
	}\
	catch (const std::runtime_error& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeRuntimeError, contextExplainText, err.what());\
		return errorReturnValue;\
	}\
	catch (const std::exception& err)\
	{\
		(errorBuffer).report( strus::ErrorCodeUncaughtException, contextExplainText, err.what());\
		return errorReturnValue;\
	}

#endif

