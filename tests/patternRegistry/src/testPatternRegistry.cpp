/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pextract/lib/extract.hpp"
#include "pextract/patternRegistryInterface.hpp"
#include "pextract/pattern.hpp"
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include <stdexcept>
#include <iostream>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <memory>

using namespace pextract;

strus::ErrorBufferInterface* g_errorBuffer = 0;

// Define a pattern that must be rejected, the error message must contain 'expectedError'
static void defineInvalid( PatternRegistryInterface* registry, const char* name, const Pattern& pattern, const char* expectedError)
{
	if (registry->definePattern( name, pattern))
	{
		throw std::runtime_error( std::string("definition of pattern '") + name + "' did not fail");
	}
	if (!g_errorBuffer->hasError())
	{
		throw std::runtime_error( std::string("failed definition of pattern '") + name + "' reported no error");
	}
	const char* errmsg = g_errorBuffer->fetchError();
	std::cerr << "expected error: " << errmsg << std::endl;
	if (!errmsg || !std::strstr( errmsg, expectedError))
	{
		throw std::runtime_error( std::string("unexpected error message for pattern '") + name + "'");
	}
}

static void define( PatternRegistryInterface* registry, const char* name, const Pattern& pattern)
{
	if (!registry->definePattern( name, pattern))
	{
		throw std::runtime_error( std::string("failed to define pattern '") + name + "'");
	}
}

static void testRegistry()
{
	std::auto_ptr<PatternRegistryInterface> registry( createPatternRegistry( g_errorBuffer));
	if (!registry.get()) throw std::runtime_error( "failed to create registry");

	define( registry.get(), "digits", atom( "[0-9]+"));
	define( registry.get(), "letters", bounded( atom( "[a-z]+"), PatternBoundary::notAdjacent( "a-z")));
	define( registry.get(), "alnum", unite( registry->resolve( "digits"), registry->resolve( "letters")));

	defineInvalid( registry.get(), "digits", atom( "[0-9]"), "duplicate");
	defineInvalid( registry.get(), "empty", atom( "a*"), "empty");
	defineInvalid( registry.get(), "broken", atom( "(ab"), "malformed");
	defineInvalid( registry.get(), "", atom( "ab"), "name");
	defineInvalid( registry.get(), "undefined", Pattern(), "undefined");

	std::vector<std::string> categories = registry->listCategories();
	const char* expected[] = {"digits","letters","alnum",0};
	std::size_t ci = 0;
	for (; expected[ci] && ci < categories.size(); ++ci)
	{
		if (categories[ ci] != expected[ ci]) break;
	}
	if (expected[ci] || ci != categories.size())
	{
		throw std::runtime_error( "categories not listed in order of definition");
	}
	if (registry->definitionIndex( "letters") != 2 || registry->definitionIndex( "nope") != 0)
	{
		throw std::runtime_error( "unexpected definition index");
	}
	if (!registry->isDefined( "alnum") || registry->isDefined( "empty") || registry->isDefined( "nope"))
	{
		throw std::runtime_error( "unexpected result of isDefined");
	}
	if (registry->resolve( "nope").defined())
	{
		throw std::runtime_error( "resolve of an unknown name returned a pattern");
	}
	if (!g_errorBuffer->hasError())
	{
		throw std::runtime_error( "resolve of an unknown name reported no error");
	}
	std::cerr << "expected error: " << g_errorBuffer->fetchError() << std::endl;
	Pattern alnum = registry->resolve( "alnum");
	if (alnum.kind() != Pattern::Union || alnum.name() != "alnum" || alnum.constituents().size() != 2)
	{
		throw std::runtime_error( "unexpected structure of resolved pattern");
	}
	if (alnum.constituents()[1].name() != "letters" || !alnum.constituents()[1].boundary().defined())
	{
		throw std::runtime_error( "constituents of resolved pattern lost their attributes");
	}
	registry->done();
	defineInvalid( registry.get(), "late", atom( "x"), "done");
	if (registry->listCategories().size() != 3)
	{
		throw std::runtime_error( "registry changed after done");
	}
}

// The first registry created defines the shared table with its own error buffer, that is deleted afterwards
static void testStandardRegistryErrorBuffers()
{
	strus::ErrorBufferInterface* firstErrorBuffer = strus::createErrorBuffer_standard( 0, 1);
	if (!firstErrorBuffer) throw std::runtime_error( "construction of error buffer failed");
	PatternRegistryInterface* first = createStandardPatternRegistry( firstErrorBuffer);
	if (!first)
	{
		delete firstErrorBuffer;
		throw std::runtime_error( "failed to create first standard registry");
	}
	std::vector<std::string> firstCategories = first->listCategories();
	delete first;
	delete firstErrorBuffer;

	std::auto_ptr<PatternRegistryInterface> second( createStandardPatternRegistry( g_errorBuffer));
	if (!second.get()) throw std::runtime_error( "failed to create second standard registry");
	if (second->listCategories() != firstCategories || firstCategories.empty())
	{
		throw std::runtime_error( "standard registries do not share the same categories");
	}
	if (second->resolve( "nope").defined())
	{
		throw std::runtime_error( "resolved undefined pattern in standard registry");
	}
	if (!g_errorBuffer->hasError())
	{
		throw std::runtime_error( "resolve of undefined pattern in standard registry not reported to its error buffer");
	}
	std::cerr << "expected error: " << g_errorBuffer->fetchError() << std::endl;
	if (second->definePattern( "extra", atom( "x")))
	{
		throw std::runtime_error( "definition of a pattern in the standard registry did not fail");
	}
	std::cerr << "expected error: " << g_errorBuffer->fetchError() << std::endl;
}

static void testStandardRegistry()
{
	std::auto_ptr<PatternRegistryInterface> registry( createStandardPatternRegistry( g_errorBuffer));
	if (!registry.get()) throw std::runtime_error( "failed to create standard registry");
	static const char* names[] = {
		"mac-address","ipv4-address","ipv6-address","ip-address","email-address",
		"obfuscated-email-address","url","uri","domain-name","ssn","phone-number",
		"amex-credit-card","discover-credit-card","mastercard-credit-card","visa-credit-card","credit-card",
		"md5","sha1","sha256","sha512","hash","aws-access-key-id","aws-secret-access-key","api-key",
		"ssh-public-key","ssh-private-key","rsa-public-key","rsa-private-key","dsa-public-key","dsa-private-key",
		"ec-public-key","ec-private-key","public-key","private-key",
		"hex-number","number","version-number",
		"absolute-unix-path","relative-unix-path","unix-path","absolute-windows-path","relative-windows-path",
		"windows-path","path","file-name","dir-name",
		"function-name","double-quoted-string","single-quoted-string","string","word","variable-name",
		"host-name","base64",0};
	std::vector<std::string> categories = registry->listCategories();
	std::size_t ni = 0;
	for (; names[ni]; ++ni)
	{
		if (ni >= categories.size() || categories[ ni] != names[ ni])
		{
			throw std::runtime_error( std::string("standard category missing or out of order: ") + names[ni]);
		}
		Pattern pattern = registry->resolve( names[ ni]);
		if (!pattern.defined() || pattern.name() != names[ ni])
		{
			throw std::runtime_error( std::string("cannot resolve standard category: ") + names[ni]);
		}
	}
	if (ni != categories.size())
	{
		throw std::runtime_error( "unexpected number of standard categories");
	}
	if (registry->resolve( "hash").kind() != Pattern::Union)
	{
		throw std::runtime_error( "category 'hash' is not a union");
	}
	if (registry->resolve( "visa-credit-card").validation() != Pattern::LuhnChecksum)
	{
		throw std::runtime_error( "category 'visa-credit-card' is not marked for checksum validation");
	}
	std::auto_ptr<PatternRegistryInterface> copy( createPatternRegistry( g_errorBuffer));
	if (!copy.get() || !defineStandardPatterns( copy.get(), g_errorBuffer))
	{
		throw std::runtime_error( "failed to define standard patterns in a new registry");
	}
	if (copy->listCategories() != categories)
	{
		throw std::runtime_error( "standard patterns differ between registries");
	}
	if (defineStandardPatterns( copy.get(), g_errorBuffer))
	{
		throw std::runtime_error( "defining standard patterns twice did not fail");
	}
	std::cerr << "expected error: " << g_errorBuffer->fetchError() << std::endl;
}

int main( int argc, const char** argv)
{
	try
	{
		g_errorBuffer = strus::createErrorBuffer_standard( 0, 1);
		if (!g_errorBuffer)
		{
			std::cerr << "construction of error buffer failed" << std::endl;
			return -1;
		}
		else if (argc > 1)
		{
			std::cerr << "too many arguments" << std::endl;
			return 1;
		}
		std::cerr << "executing test registry" << std::endl;
		testRegistry();
		std::cerr << "executing test standard registry error buffers" << std::endl;
		testStandardRegistryErrorBuffers();
		std::cerr << "executing test standard registry" << std::endl;
		testStandardRegistry();
		if (g_errorBuffer->hasError())
		{
			throw std::runtime_error( "unexpected error");
		}
		std::cerr << "OK" << std::endl;
		delete g_errorBuffer;
		return 0;
	}
	catch (const std::runtime_error& err)
	{
		if (g_errorBuffer->hasError())
		{
			std::cerr << "error in pattern registry test: "
					<< g_errorBuffer->fetchError() << " (" << err.what()
					<< ")" << std::endl;
		}
		else
		{
			std::cerr << "error in pattern registry test: "
					<< err.what() << std::endl;
		}
	}
	catch (const std::bad_alloc&)
	{
		std::cerr << "out of memory in pattern registry test" << std::endl;
	}
	delete g_errorBuffer;
	return -1;
}

