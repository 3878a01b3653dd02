#include<vector>

#include"../../include/DistributedPPO/Distribution/Distribution.hpp"

namespace DistributedPPO
{
    std::vector<int64_t> Distribution::extendedShape(c10::ArrayRef<int64_t> sampleShape) const
    {
        std::vector<int64_t> outputShape(sampleShape.begin(), sampleShape.end());
        outputShape.insert(outputShape.end(), batchShape.begin(), batchShape.end());
        outputShape.insert(outputShape.end(), eventShape.begin(), eventShape.end());
        return outputShape;
    }
}
