#include "kabsch/yaml_emitters.h"

#include <yaml-cpp/yaml.h>

YAML::Emitter& kabsch::operator<<(YAML::Emitter& emitter, const cv::Mat& matrix)
{
    cv::Mat values;
    matrix.convertTo(values, CV_64F);

    emitter << YAML::BeginSeq;
    for (auto r = 0; r < values.rows; ++r)
    {
        emitter << YAML::Flow << YAML::BeginSeq;
        for (auto c = 0; c < values.cols; ++c)
        {
            emitter << values.at<double>(r, c);
        }
        emitter << YAML::EndSeq;
    }
    emitter << YAML::EndSeq;

    return emitter;
}

YAML::Emitter& kabsch::operator<<(YAML::Emitter& emitter, const similarity& similarity)
{
    cv::Mat translation;
    similarity.translation.convertTo(translation, CV_64F);

    emitter << YAML::BeginMap;
    emitter << YAML::Key << "scale" << YAML::Value << similarity.scale;
    emitter << YAML::Key << "rotation" << YAML::Value << similarity.rotation;
    emitter << YAML::Key << "translation" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (auto r = 0; r < translation.rows; ++r)
    {
        emitter << translation.at<double>(r, 0);
    }
    emitter << YAML::EndSeq;
    emitter << YAML::EndMap;

    return emitter;
}
