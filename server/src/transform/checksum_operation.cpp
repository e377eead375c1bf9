#include "chunkyard/crypto.hpp"
#include "chunkyard/server/service_error.hpp"
#include "chunkyard/server/transform/operations.hpp"

namespace chunkyard::server::transform
{

    namespace
    {
        crypto::DigestAlgorithm algorithm_of(const nlohmann::json &params)
        {
            const auto name = string_param(params, "algorithm").value_or("sha256");
            const auto algorithm = crypto::digest_algorithm_from_string(name);
            if (!algorithm)
            {
                throw_validation("Unsupported checksum algorithm: " + name);
            }
            return *algorithm;
        }
    } // namespace

    void ChecksumOperation::validate(const nlohmann::json &params, std::size_t input_count) const
    {
        require_inputs(kind(), input_count, 1, 1);
        algorithm_of(params);
    }

    OperationResult ChecksumOperation::run(const OperationContext &context)
    {
        const auto algorithm = algorithm_of(context.params);
        OperationResult result;
        result.result = {
            {"algorithm", std::string(crypto::to_string(algorithm))},
            {"checksum", crypto::hash_file(context.inputs.front().path, algorithm)},
        };
        context.report_progress(100.0);
        return result;
    }

} // namespace chunkyard::server::transform
