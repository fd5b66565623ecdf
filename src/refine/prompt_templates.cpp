#include "refine/prompt_templates.hpp"

namespace medscribe {
namespace refine {
namespace prompts {

std::string buildImprovePrompt(const std::string& transcript) {
    return
        "Você é um assistente especializado em melhorar transcrições médicas.\n"
        "Sua tarefa é corrigir e melhorar a seguinte transcrição de uma consulta médica:\n"
        "\n"
        "Transcrição original:\n" + transcript + "\n"
        "\n"
        "Por favor:\n"
        "1. Corrija erros de gramática e ortografia\n"
        "2. Melhore a pontuação e formatação\n"
        "3. Organize o texto de forma clara e profissional\n"
        "4. Mantenha todos os termos médicos e informações importantes\n"
        "5. Se possível, estruture em seções (ex: Queixa principal, Histórico, Exame físico, etc.)\n"
        "\n"
        "Retorne apenas o texto melhorado, sem comentários adicionais:\n";
}

std::string buildDefaultSummaryPrompt(const std::string& transcript) {
    return
        "Você é um assistente médico especializado em criar resumos de consultas médicas.\n"
        "Analise a seguinte transcrição e crie um resumo estruturado e profissional:\n"
        "\n"
        "Transcrição:\n" + transcript + "\n"
        "\n"
        "Por favor, crie um resumo seguindo esta estrutura:\n"
        "\n"
        "## RESUMO DA CONSULTA\n"
        "\n"
        "**Data:** [Extrair se mencionada ou indicar como não especificada]\n"
        "**Paciente:** [Nome se mencionado ou \"Não especificado\"]\n"
        "\n"
        "### 🔍 QUEIXA PRINCIPAL\n"
        "[Motivo principal da consulta]\n"
        "\n"
        "### 📋 HISTÓRICO\n"
        "[Histórico relevante mencionado]\n"
        "\n"
        "### 🩺 EXAME FÍSICO\n"
        "[Achados do exame físico se mencionados]\n"
        "\n"
        "### 💊 CONDUTA/TRATAMENTO\n"
        "[Medicações, orientações ou tratamentos prescritos]\n"
        "\n"
        "### 📝 OBSERVAÇÕES IMPORTANTES\n"
        "[Pontos relevantes adicionais]\n"
        "\n"
        "### 🔄 RETORNO\n"
        "[Orientações sobre retorno se mencionadas]\n"
        "\n"
        "Mantenha o resumo conciso, profissional e focado nos aspectos médicos mais importantes.\n";
}

std::string buildCustomSummaryPrompt(const std::string& instruction, const std::string& transcript) {
    return
        "Você é um assistente médico especializado em criar resumos de consultas médicas.\n"
        "Analise a seguinte transcrição seguindo as instruções específicas do usuário:\n"
        "\n"
        "INSTRUÇÕES DO USUÁRIO:\n" + instruction + "\n"
        "\n"
        "Transcrição:\n" + transcript + "\n"
        "\n"
        "Por favor, crie um resumo seguindo exatamente as instruções fornecidas pelo usuário acima.\n"
        "Mantenha o resumo profissional e focado nos aspectos médicos mais importantes.\n";
}

} // namespace prompts
} // namespace refine
} // namespace medscribe
