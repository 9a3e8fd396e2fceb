#include "tokenbag/ffi.hpp"

TokenBagHandle *tokenbag_new()
{
    return new TokenBagHandle();
}

void tokenbag_delete(TokenBagHandle *bag)
{
    delete bag;
}

uint64_t tokenbag_insert(TokenBagHandle *bag, void *elm)
{
    return non_null(bag)->insert(elm);
}

void tokenbag_remove(TokenBagHandle *bag, uint64_t token)
{
    non_null(bag)->remove(token);
}

bool tokenbag_contains(const TokenBagHandle *bag, uint64_t token)
{
    return non_null(bag)->contains(token);
}

size_t tokenbag_size(const TokenBagHandle *bag)
{
    return non_null(bag)->size();
}

bool tokenbag_empty(const TokenBagHandle *bag)
{
    return non_null(bag)->empty();
}

void *tokenbag_index(const TokenBagHandle *bag, size_t i)
{
    return (*non_null(bag))[i];
}

void tokenbag_clear(TokenBagHandle *bag)
{
    non_null(bag)->clear();
}
