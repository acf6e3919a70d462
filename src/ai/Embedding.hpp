#pragma once
#include <cstddef>
#include <vector>

// 고정 길이 얼굴 임베딩. 생성 시 L2 정규화 (영벡터는 그대로 둔다)
class Embedding {
public:
	Embedding() = default;
	explicit Embedding(std::vector<float> raw);

	const std::vector<float>& values() const { return v_; }
	std::size_t size() const { return v_.size(); }
	bool empty() const { return v_.empty(); }

	double norm() const;

private:
	std::vector<float> v_;
};
