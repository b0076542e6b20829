/*
	Copyright © 2026 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the shingle
    distribution for more details.
*/

//
// Created by nestal on 10/19/26.
//

#pragma once

#include <array>
#include <cstddef>
#include <type_traits>

namespace shg {

void secure_random(void* buf, std::size_t size);
void insecure_random(void* buf, std::size_t size);

template <typename T>
T secure_random()
{
	static_assert(std::is_standard_layout_v<T>);
	T t;
	secure_random(&t, sizeof(t));
	return t;
}

template <typename T>
T insecure_random()
{
	static_assert(std::is_standard_layout_v<T>);
	T t;
	insecure_random(&t, sizeof(t));
	return t;
}

template <typename T, std::size_t size> std::array<T,size> secure_random_array()
{
	return secure_random<std::array<T,size>>();
}

} // end of namespace shg
