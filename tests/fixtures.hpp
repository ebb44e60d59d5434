#pragma once
// Values computed once with an independent PBKDF2-HMAC-SHA512 / AES-256-CBC
// implementation and pinned here.

static const char* const MASTER_SECRET = "mT9GKQaN44AGV1vd";

// PBKDF2-SHA512(MASTER_SECRET, "config", 1000)
static const char* const CONFIG_KEY_HEX =
    "377dfb581681464c31b35ffdf6f3b6053dd5ee9eda51a123bd26a4ea40ab44ed";

// PBKDF2-SHA512(MASTER_SECRET, "example.com", 1001)
static const char* const EXAMPLE_COM_KEY_HEX =
    "1483176f77952e7dac896f704c50b5e8daa08a5daee3c4e6bfb9da61fae62c38";

// PBKDF2-SHA512("", "config", 1000)
static const char* const EMPTY_SECRET_CONFIG_KEY_HEX =
    "f69dbad505f711a04ed720d12627164bcb1dfd81137938d2065c502c0d8ae153";

// AES-256-CBC under CONFIG_KEY_HEX, IV 000102..0f, of:
// [{"name":"example.com","iterations":1,"pattern":"c16"},
//  {"name":"github.com","iterations":3,"pattern":"n4"},
//  {"name":"mail.example.org"}]
static const char* const FIXTURE_BLOB =
    "000102030405060708090a0b0c0d0e0f"
    "4426c354e30f7d07b34ca7354521b4ad91a971419e28d71f3d45e2fa49cd84d72236f646b074223477691a6ed1a3c559"
    "a62028ed8579560fcc9fff2bde6bee3474c2587776b4fad5ef68711b5824a360894c96fe4f3633deef3516623eba549a"
    "d5023696e842d89eefd90847b1df4dc045b0fef91d83aadc280433b2d7024ef926dd38ef404f9fe3e9c25010309b8e63";
