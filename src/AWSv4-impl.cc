/**
 * Primitives for AWS signature version 4.
 *
 * These were originally authored by the HTCondor team under the Apache 2.0 license which
 * can also be found in the LICENSE file at the top-level directory of this project.  No
 * copyright statement was present in the original file.
 */

#include "AWSv4-impl.hh"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cstring>
#include <string>

namespace AWSv4Impl {

std::string amazonURLEncode(std::string_view input,
							std::string_view extraSafe) {
	/*
	 * See
	 * https://docs.aws.amazon.com/AmazonS3/latest/API/sig-v4-header-based-auth.html
	 */
	static const char hexDigits[] = "0123456789ABCDEF";
	std::string output;
	output.reserve(input.size() * 3);
	for (char c : input) {
		// "Do not URL encode ... A-Z, a-z, 0-9, hyphen ( - ),
		// underscore ( _ ), period ( . ), and tilde ( ~ ).  Percent
		// encode all other characters with %XY, where X and Y are hex
		// characters 0-9 and uppercase A-F.  Percent encode extended
		// UTF-8 characters in the form %XY%ZA..."
		if (('A' <= c && c <= 'Z') || ('a' <= c && c <= 'z') ||
			('0' <= c && c <= '9') || c == '-' || c == '_' || c == '.' ||
			c == '~' || extraSafe.find(c) != std::string_view::npos) {
			output += c;
		} else {
			auto byte = static_cast<unsigned char>(c);
			output += '%';
			output += hexDigits[byte >> 4];
			output += hexDigits[byte & 0x0f];
		}
	}

	return output;
}

// Note that we don't have to worry about path normalization, because S3
// objects aren't actually path names; empty segments ("a//b") are kept.
std::string pathEncode(std::string_view original) {
	return amazonURLEncode(original, "/");
}

void convertMessageDigestToLowercaseHex(const unsigned char *messageDigest,
										unsigned int mdLength,
										std::string &hexEncoded) {
	static const char hexDigits[] = "0123456789abcdef";
	hexEncoded.resize(mdLength * 2);
	for (unsigned int i = 0; i < mdLength; ++i) {
		hexEncoded[2 * i] = hexDigits[messageDigest[i] >> 4];
		hexEncoded[2 * i + 1] = hexDigits[messageDigest[i] & 0x0f];
	}
}

bool doSha256(std::string_view payload, unsigned char *messageDigest,
			  unsigned int *mdLength) {
	EVP_MD_CTX *mdctx = EVP_MD_CTX_create();
	if (mdctx == NULL) {
		return false;
	}

	if (!EVP_DigestInit_ex(mdctx, EVP_sha256(), NULL)) {
		EVP_MD_CTX_destroy(mdctx);
		return false;
	}

	if (!EVP_DigestUpdate(mdctx, payload.data(), payload.length())) {
		EVP_MD_CTX_destroy(mdctx);
		return false;
	}

	if (!EVP_DigestFinal_ex(mdctx, messageDigest, mdLength)) {
		EVP_MD_CTX_destroy(mdctx);
		return false;
	}

	EVP_MD_CTX_destroy(mdctx);
	return true;
}

bool doHmacSha256(const unsigned char *key, size_t keyLength,
				  std::string_view data, unsigned char *messageDigest,
				  unsigned int *mdLength) {
	const unsigned char *hmac =
		HMAC(EVP_sha256(), key, static_cast<int>(keyLength),
			 reinterpret_cast<const unsigned char *>(data.data()),
			 data.length(), messageDigest, mdLength);
	return hmac != NULL;
}

bool deriveSigningKey(const std::string &secretAccessKey,
					  std::string_view date, std::string_view region,
					  std::string_view service,
					  std::vector<unsigned char> &signingKey) {
	unsigned int mdLength = 0;
	unsigned char messageDigest[EVP_MAX_MD_SIZE];
	unsigned int md2Length = 0;
	unsigned char messageDigest2[EVP_MAX_MD_SIZE];

	std::string saKey = "AWS4" + secretAccessKey;
	bool ok = doHmacSha256(
		reinterpret_cast<const unsigned char *>(saKey.data()), saKey.length(),
		date, messageDigest, &mdLength);
	// Don't leave the secret lingering in the heap.
	OPENSSL_cleanse(&saKey[0], saKey.size());
	if (!ok) {
		return false;
	}

	if (!doHmacSha256(messageDigest, mdLength, region, messageDigest2,
					  &md2Length)) {
		return false;
	}

	if (!doHmacSha256(messageDigest2, md2Length, service, messageDigest,
					  &mdLength)) {
		return false;
	}

	if (!doHmacSha256(messageDigest, mdLength, "aws4_request", messageDigest2,
					  &md2Length)) {
		return false;
	}

	signingKey.assign(messageDigest2, messageDigest2 + md2Length);
	OPENSSL_cleanse(messageDigest, sizeof(messageDigest));
	OPENSSL_cleanse(messageDigest2, sizeof(messageDigest2));
	return true;
}

bool signWithKey(const std::vector<unsigned char> &signingKey,
				 std::string_view stringToSign, std::string &signature) {
	unsigned int mdLength = 0;
	unsigned char messageDigest[EVP_MAX_MD_SIZE];
	if (!doHmacSha256(signingKey.data(), signingKey.size(), stringToSign,
					  messageDigest, &mdLength)) {
		return false;
	}
	convertMessageDigestToLowercaseHex(messageDigest, mdLength, signature);
	return true;
}

} // namespace AWSv4Impl
