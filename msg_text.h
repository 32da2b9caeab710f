#pragma once
#include <string>

// Entfernt ASCII-Whitespace an beiden Enden.
void msg_trim_inplace(std::string& s);
