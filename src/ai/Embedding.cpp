#include "Embedding.hpp"
#include <cmath>

Embedding::Embedding(std::vector<float> raw) : v_(std::move(raw))
{
	double ss = 0.0;
	for (float x : v_) ss += static_cast<double>(x) * x;

	const double n = std::sqrt(ss);
	if (n > 0.0) {
		for (float& x : v_) x = static_cast<float>(x / n);
	}
}

double Embedding::norm() const
{
	double ss = 0.0;
	for (float x : v_) ss += static_cast<double>(x) * x;
	return std::sqrt(ss);
}
