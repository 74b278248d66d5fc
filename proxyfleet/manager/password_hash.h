#pragma once
#include <string>
#include <string_view>

// Apache MD5-crypt ("$apr1$<salt>$<digest>"), the format htpasswd writes and
// Squid's basic_ncsa_auth verifies.

// Returns an empty string if the digest could not be computed
std::string apr1_crypt(std::string_view password, std::string_view salt);

// Eight characters from the crypt alphabet, drawn from the OpenSSL CSPRNG.
// Empty on RNG failure.
std::string apr1_random_salt();

// Constant-time comparison against a stored "$apr1$..." hash
bool apr1_verify(std::string_view password, std::string_view hash);
