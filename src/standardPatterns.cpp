/*
 * Copyright (c) 2016 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Definitions of the standard categories
/// \file "standardPatterns.cpp"
#include "standardPatterns.hpp"
#include "patternRegistry.hpp"
#include "pextract/pattern.hpp"
#include "pextract/patternRegistryInterface.hpp"
#include "strus/errorBufferInterface.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include <boost/thread/mutex.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace pextract;

#define WORD_CHARS		"A-Za-z0-9_"
#define HEX_CHARS		"0-9A-Fa-f"
#define PATH_SEGMENT_CHARS	"A-Za-z0-9_.+@%,=~-"
#define WINPATH_SEGMENT_CHARS	"A-Za-z0-9_.+@%,=~$-"
#define URL_CHARS		"A-Za-z0-9._~!$&'()*+,;=:@%/?-"
#define USERINFO_CHARS		"A-Za-z0-9._~!$&'()*+,;=%-"

namespace {
class StandardPatternDefinition
{
public:
	StandardPatternDefinition( PatternRegistryInterface& registry_, strus::ErrorBufferInterface* errorhnd_)
		:m_registry(registry_),m_errorhnd(errorhnd_){}

	void define( const char* name, const Pattern& pattern)
	{
		if (!m_registry.definePattern( name, pattern))
		{
			throw pextract::runtime_error( "%s", m_errorhnd->fetchError());
		}
	}

	Pattern get( const char* name) const
	{
		Pattern rt = m_registry.resolve( name);
		if (!rt.defined())
		{
			const char* errmsg = m_errorhnd->fetchError();
			throw UnknownPatternError( errmsg ? errmsg : (std::string(_TXT("undefined pattern referenced")) + " '" + name + "'"));
		}
		return rt;
	}

	Pattern uniteDefined( const char* n1, const char* n2) const
	{
		return unite( get( n1), get( n2));
	}
	Pattern uniteDefined( const char* n1, const char* n2, const char* n3) const
	{
		return unite( get( n1), get( n2), get( n3));
	}
	Pattern uniteDefined( const char* n1, const char* n2, const char* n3, const char* n4) const
	{
		return unite( get( n1), get( n2), get( n3), get( n4));
	}

private:
	PatternRegistryInterface& m_registry;
	strus::ErrorBufferInterface* m_errorhnd;
};
}//anonymous namespace

// Line breaks are passed as control characters, so that the expressions mean the same for the automaton and for TRE

// Block delimited by '-----BEGIN <label>-----' and '-----END <label>-----' with optional headers and base64 lines as content
static Pattern pemBlock( const std::string& label)
{
	std::vector<Pattern> parts;
	parts.push_back( literal( std::string("-----BEGIN ") + label + "-----"));
	parts.push_back( atom( "\r?\n"));
	parts.push_back( repeat( atom( "[A-Za-z][A-Za-z0-9-]*: [^\r\n]*\r?\n"), 0, 0));
	parts.push_back( optional( atom( "\r?\n")));
	parts.push_back( repeat( atom( "[A-Za-z0-9+/=]+\r?\n"), 1, 0));
	parts.push_back( literal( std::string("-----END ") + label + "-----"));
	return sequence( parts);
}

// Key block in the format of RFC 4716 (SSH public key file format)
static Pattern rfc4716Block()
{
	std::vector<Pattern> parts;
	parts.push_back( literal( "---- BEGIN SSH2 PUBLIC KEY ----"));
	parts.push_back( atom( "\r?\n"));
	parts.push_back( repeat( atom( "[A-Za-z][A-Za-z0-9-]*: [^\r\n]*\r?\n"), 0, 0));
	parts.push_back( repeat( atom( "[A-Za-z0-9+/=]+\r?\n"), 1, 0));
	parts.push_back( literal( "---- END SSH2 PUBLIC KEY ----"));
	return sequence( parts);
}

void pextract::defineStandardPatternTable( PatternRegistryInterface& registry, strus::ErrorBufferInterface* errorhnd)
{
	StandardPatternDefinition def( registry, errorhnd);

	// Building blocks:
	Pattern hexByte = atom( "[" HEX_CHARS "]{2}");
	Pattern octet = atom( "25[0-5]|2[0-4][0-9]|1[0-9][0-9]|[1-9]?[0-9]");
	Pattern ipv4 = sequence( octet, repeat( sequence( literal("."), octet), 3, 3));
	Pattern h16 = atom( "[" HEX_CHARS "]{1,4}");
	Pattern h16colon = sequence( h16, literal(":"));
	Pattern colonh16 = sequence( literal(":"), h16);
	std::vector<Pattern> ipv6forms;
	ipv6forms.push_back( sequence( repeat( h16colon, 7, 7), h16));
	ipv6forms.push_back( sequence( repeat( h16colon, 1, 4), literal(":"), ipv4));
	ipv6forms.push_back( sequence( repeat( h16colon, 1, 7), literal(":")));
	ipv6forms.push_back( sequence( repeat( h16colon, 1, 6), colonh16));
	ipv6forms.push_back( sequence( repeat( h16colon, 1, 5), repeat( colonh16, 1, 2)));
	ipv6forms.push_back( sequence( repeat( h16colon, 1, 4), repeat( colonh16, 1, 3)));
	ipv6forms.push_back( sequence( repeat( h16colon, 1, 3), repeat( colonh16, 1, 4)));
	ipv6forms.push_back( sequence( repeat( h16colon, 1, 2), repeat( colonh16, 1, 5)));
	ipv6forms.push_back( sequence( h16colon, repeat( colonh16, 1, 6)));
	ipv6forms.push_back( sequence( atom( "::(ffff(:0{1,4})?:)?"), ipv4));
	ipv6forms.push_back( sequence( literal(":"), unite( repeat( colonh16, 1, 7), literal(":"))));
	Pattern ipv6 = unite( ipv6forms);

	Pattern label = atom( "[A-Za-z0-9]([A-Za-z0-9-]*[A-Za-z0-9])?");
	Pattern tld = atom( "[A-Za-z]{2,63}");
	Pattern domain = sequence( repeat( sequence( label, literal(".")), 1, 0), tld);
	Pattern localPart = atom( "[A-Za-z0-9_%+-]+(\\.[A-Za-z0-9_%+-]+)*");

	Pattern identifier = atom( "[A-Za-z_][A-Za-z0-9_]*");
	Pattern pathSegment = atom( "[" PATH_SEGMENT_CHARS "]+");
	Pattern winSegment = atom( "[" WINPATH_SEGMENT_CHARS "]+");
	Pattern slash = literal( "/");
	Pattern backslash = literal( "\\");

	// Network:
	def.define( "mac-address",
		bounded( unite(
				sequence( hexByte, repeat( sequence( literal(":"), hexByte), 5, 5)),
				sequence( hexByte, repeat( sequence( literal("-"), hexByte), 5, 5))),
			PatternBoundary::notAdjacent( WORD_CHARS ":-")));
	def.define( "ipv4-address",
		bounded( ipv4, PatternBoundary( WORD_CHARS ".", "", "[^" WORD_CHARS ".]|\\.[^0-9]|\\.$|$")));
	def.define( "ipv6-address",
		bounded( ipv6, PatternBoundary::notAdjacent( WORD_CHARS ":")));
	def.define( "ip-address", def.uniteDefined( "ipv4-address", "ipv6-address"));

	def.define( "email-address",
		bounded( sequence( localPart, literal("@"), domain),
			PatternBoundary( "A-Za-z0-9_%+-", WORD_CHARS "-")));
	{
		Pattern atDelim = atom( " ?[[({<] ?(at|AT) ?[])}>] ?| (at|AT) ");
		Pattern dotDelim = atom( "\\.| ?[[({<] ?(dot|DOT) ?[])}>] ?| (dot|DOT) ");
		Pattern obfuscatedDomain = sequence( repeat( sequence( label, dotDelim), 1, 0), tld);
		def.define( "obfuscated-email-address",
			bounded( sequence( localPart, atDelim, obfuscatedDomain),
				PatternBoundary( "A-Za-z0-9_%+-", WORD_CHARS "-")));
	}
	{
		std::vector<Pattern> parts;
		parts.push_back( atom( "https?|ftps?|sftp|ssh|telnet|wss?|git|svn|irc|ldaps?|rtsp|smb|nntp"));
		parts.push_back( literal( "://"));
		parts.push_back( optional( atom( "[" USERINFO_CHARS "]+(:[" USERINFO_CHARS "]*)?@")));
		parts.push_back( unite( domain, ipv4, sequence( literal("["), ipv6, literal("]")), label));
		parts.push_back( optional( atom( ":[0-9]{1,5}")));
		parts.push_back( repeat( atom( "/[" URL_CHARS "]*"), 0, 0));
		parts.push_back( optional( atom( "\\?[" URL_CHARS "]*")));
		parts.push_back( optional( atom( "#[" URL_CHARS "]*")));
		def.define( "url", bounded( sequence( parts), PatternBoundary( WORD_CHARS "+.-", "")));
	}
	def.define( "uri",
		bounded( sequence(
				atom( "[A-Za-z][A-Za-z0-9+.-]*"),
				literal( ":"),
				atom( "[A-Za-z0-9._~!$&'()*+,;=@%/?#-][#" URL_CHARS "]*")),
			PatternBoundary( WORD_CHARS "+.-", "")));
	def.define( "domain-name",
		bounded( domain, PatternBoundary( WORD_CHARS ".-", WORD_CHARS "-")));

	// Personal data:
	def.define( "ssn",
		bounded( atom( "[0-9]{3}-[0-9]{2}-[0-9]{4}"), PatternBoundary::notAdjacent( WORD_CHARS "-")));
	{
		PatternBoundary phoneBoundary = PatternBoundary::notAdjacent( WORD_CHARS "-");
		def.define( "phone-number", unite(
			bounded( atom( "(\\+?1[ .-]?)?(\\([0-9]{3}\\) ?|[0-9]{3}[ .-])[0-9]{3}[ .-][0-9]{4}"), phoneBoundary),
			bounded( atom( "[0-9]{3}-[0-9]{4}"), phoneBoundary),
			bounded( atom( "\\+[0-9]{1,3}([ .-][0-9]{1,4}){2,5}"), phoneBoundary)));
	}
	{
		PatternBoundary cardBoundary = PatternBoundary::notAdjacent( WORD_CHARS "-");
		def.define( "amex-credit-card", validated( bounded(
			atom( "3[47][0-9]{2}[ -]?[0-9]{6}[ -]?[0-9]{5}"), cardBoundary), Pattern::LuhnChecksum));
		def.define( "discover-credit-card", validated( bounded(
			atom( "6(011|5[0-9]{2}|4[4-9][0-9])([ -]?[0-9]{4}){3}"), cardBoundary), Pattern::LuhnChecksum));
		def.define( "mastercard-credit-card", validated( bounded(
			atom( "(5[1-5][0-9]{2}|222[1-9]|22[3-9][0-9]|2[3-6][0-9]{2}|27[01][0-9]|2720)([ -]?[0-9]{4}){3}"), cardBoundary), Pattern::LuhnChecksum));
		def.define( "visa-credit-card", validated( bounded(
			atom( "4[0-9]{3}([ -]?[0-9]{4}){3}|4[0-9]{12}"), cardBoundary), Pattern::LuhnChecksum));
		def.define( "credit-card", def.uniteDefined( "amex-credit-card", "discover-credit-card", "mastercard-credit-card", "visa-credit-card"));
	}

	// Credentials:
	{
		PatternBoundary hexBoundary = PatternBoundary::notAdjacent( HEX_CHARS);
		def.define( "md5", bounded( atom( "[" HEX_CHARS "]{32}"), hexBoundary));
		def.define( "sha1", bounded( atom( "[" HEX_CHARS "]{40}"), hexBoundary));
		def.define( "sha256", bounded( atom( "[" HEX_CHARS "]{64}"), hexBoundary));
		def.define( "sha512", bounded( atom( "[" HEX_CHARS "]{128}"), hexBoundary));
		def.define( "hash", def.uniteDefined( "md5", "sha1", "sha256", "sha512"));
	}
	def.define( "aws-access-key-id",
		bounded( atom( "(AKIA|ASIA|AGPA|AIDA|AROA|AIPA|ANPA|ANVA|APKA|ABIA|ACCA)[A-Z0-9]{16}"),
			PatternBoundary::notAdjacent( "A-Za-z0-9")));
	def.define( "aws-secret-access-key",
		bounded( atom( "[A-Za-z0-9/+]{40}"), PatternBoundary::notAdjacent( "A-Za-z0-9/+=")));
	def.define( "api-key", def.uniteDefined( "hash", "aws-access-key-id", "aws-secret-access-key"));

	def.define( "ssh-public-key", unite(
		rfc4716Block(),
		bounded( atom( "(ssh-(rsa|dss|ed25519)|ecdsa-sha2-nistp(256|384|521)) AAAA[A-Za-z0-9+/]+=*( [A-Za-z0-9_.@-]+)?"),
			PatternBoundary( WORD_CHARS "-", ""))));
	def.define( "ssh-private-key", pemBlock( "OPENSSH PRIVATE KEY"));
	def.define( "rsa-public-key", pemBlock( "RSA PUBLIC KEY"));
	def.define( "rsa-private-key", pemBlock( "RSA PRIVATE KEY"));
	def.define( "dsa-public-key", pemBlock( "DSA PUBLIC KEY"));
	def.define( "dsa-private-key", pemBlock( "DSA PRIVATE KEY"));
	def.define( "ec-public-key", pemBlock( "EC PUBLIC KEY"));
	def.define( "ec-private-key", pemBlock( "EC PRIVATE KEY"));
	def.define( "public-key", def.uniteDefined( "ssh-public-key", "rsa-public-key", "dsa-public-key", "ec-public-key"));
	def.define( "private-key", def.uniteDefined( "ssh-private-key", "rsa-private-key", "dsa-private-key", "ec-private-key"));

	// Numbers:
	def.define( "hex-number",
		bounded( atom( "0[xX][" HEX_CHARS "]+"), PatternBoundary::notAdjacent( WORD_CHARS)));
	def.define( "number",
		bounded( atom( "[+-]?[0-9]+(\\.[0-9]+)?"), PatternBoundary::notAdjacent( WORD_CHARS)));
	def.define( "version-number",
		bounded( atom( "[0-9]+(\\.[0-9]+)+"), PatternBoundary( WORD_CHARS ".", WORD_CHARS)));

	// File system:
	{
		PatternBoundary unixPathBoundary( "/:" PATH_SEGMENT_CHARS, "");
		def.define( "absolute-unix-path",
			bounded( sequence( repeat( sequence( slash, pathSegment), 1, 0), optional( slash)), unixPathBoundary));
		def.define( "relative-unix-path",
			bounded( sequence( pathSegment, repeat( sequence( slash, pathSegment), 1, 0), optional( slash)), unixPathBoundary));
		def.define( "unix-path", def.uniteDefined( "absolute-unix-path", "relative-unix-path"));
	}
	{
		Pattern winSegments = sequence( winSegment, repeat( sequence( backslash, winSegment), 0, 0), optional( backslash));
		Pattern drivePath = sequence( atom( "[A-Za-z]:\\\\"), optional( winSegments));
		Pattern uncPath = sequence( literal( "\\\\"), winSegment, repeat( sequence( backslash, winSegment), 1, 0), optional( backslash));
		def.define( "absolute-windows-path",
			bounded( unite( drivePath, uncPath), PatternBoundary( WORD_CHARS "\\\\", "")));
		def.define( "relative-windows-path",
			bounded( sequence( winSegment, repeat( sequence( backslash, winSegment), 1, 0), optional( backslash)),
				PatternBoundary( "A-Za-z0-9_\\\\.+@%,=~$:-", "")));
		def.define( "windows-path", def.uniteDefined( "absolute-windows-path", "relative-windows-path"));
	}
	def.define( "path", def.uniteDefined( "unix-path", "windows-path"));
	def.define( "file-name",
		bounded( atom( "[A-Za-z0-9_+-][A-Za-z0-9_.+-]*\\.[A-Za-z0-9]{1,10}"),
			PatternBoundary( "A-Za-z0-9_.+/\\\\@-", "A-Za-z0-9_+/\\\\@-")));
	def.define( "dir-name",
		bounded( pathSegment, PatternBoundary( PATH_SEGMENT_CHARS, "", "/|\\\\")));

	// Source code:
	def.define( "function-name",
		bounded( identifier, PatternBoundary( WORD_CHARS, "", " *\\(")));
	def.define( "double-quoted-string", atom( "\"([^\"\\\\]|\\\\.)*\""));
	def.define( "single-quoted-string", atom( "'([^'\\\\]|\\\\.)*'"));
	def.define( "string", def.uniteDefined( "double-quoted-string", "single-quoted-string"));

	// Text:
	def.define( "word",
		bounded( atom( "[" WORD_CHARS "]+"), PatternBoundary::notAdjacent( WORD_CHARS)));
	def.define( "variable-name",
		bounded( identifier, PatternBoundary::notAdjacent( WORD_CHARS)));
	def.define( "host-name", def.uniteDefined( "word", "domain-name"));
	def.define( "base64",
		bounded( atom( "([A-Za-z0-9+/]{4})*([A-Za-z0-9+/]{4}|[A-Za-z0-9+/]{2}==|[A-Za-z0-9+/]{3}=)"),
			PatternBoundary::notAdjacent( "A-Za-z0-9+/=")));
}

static boost::mutex g_standardRegistryMutex;
// Table of the standard categories, it is never queried itself and has no error buffer
static std::auto_ptr<PatternRegistry> g_standardRegistry;

PatternRegistry* pextract::createStandardPatternRegistryHandle( strus::ErrorBufferInterface* errorhnd)
{
	boost::mutex::scoped_lock lock( g_standardRegistryMutex);
	if (!g_standardRegistry.get())
	{
		PatternRegistry registry( errorhnd);
		defineStandardPatternTable( registry, errorhnd);
		registry.done();
		g_standardRegistry.reset( new PatternRegistry( registry, 0));
	}
	return new PatternRegistry( *g_standardRegistry, errorhnd);
}

